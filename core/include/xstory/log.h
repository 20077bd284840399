#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace xstory::log {

enum class Level {
  Info,
  Warn,
  Error,
  Off
};

// Opens <logs_dir>/<app_name>_<stamp>.log; an empty logs_dir keeps logging
// in memory and on the console only.
void init(const std::string& app_name, const std::filesystem::path& logs_dir);
void shutdown();
void install_crash_handlers();

// Lowest level echoed to stderr. The log file and ring buffer see everything.
void set_console_level(Level level);
Level console_level();

void info(std::string_view msg);
void warn(std::string_view msg);
void error(std::string_view msg);

std::vector<std::string> recent(size_t max_entries = 200);
const std::filesystem::path& current_log_file();

} // namespace xstory::log
