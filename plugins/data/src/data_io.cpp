#include "xstory_data/serialization.h"

#include "xstory/log.h"

#include <fstream>
#include <sstream>

namespace xstory::data {

bool read_text_file(const std::filesystem::path& path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    xstory::log::warn(std::string("failed to read file: ") + path.string());
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

bool write_text_file(const std::filesystem::path& path, const std::string& contents) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    xstory::log::warn(std::string("failed to write file: ") + path.string());
    return false;
  }
  out << contents;
  return static_cast<bool>(out);
}

} // namespace xstory::data
