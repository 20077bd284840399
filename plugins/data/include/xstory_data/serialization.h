#pragma once

#include <filesystem>
#include <string>

namespace xstory::data {

bool read_text_file(const std::filesystem::path& path, std::string& out);
bool write_text_file(const std::filesystem::path& path, const std::string& contents);

} // namespace xstory::data
