#include "xstory/log.h"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace xstory::log {

namespace {
std::mutex g_mutex;
std::ofstream g_file;
std::filesystem::path g_file_path;
std::deque<std::string> g_ring;
constexpr size_t kRingMax = 200;
std::string g_app = "xstory";
Level g_console_level = Level::Warn;

const char* level_tag(Level level) {
  switch (level) {
    case Level::Info:
      return "INFO";
    case Level::Warn:
      return "WARN";
    case Level::Error:
      return "ERROR";
    case Level::Off:
      break;
  }
  return "?";
}

std::string stamp(const char* pattern) {
  const auto tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &tt);
#else
  localtime_r(&tt, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, pattern);
  return oss.str();
}

// Caller holds g_mutex.
void record(const std::string& line) {
  if (g_file.is_open()) {
    g_file << line << "\n";
    g_file.flush();
  }
  g_ring.push_back(line);
  while (g_ring.size() > kRingMax) {
    g_ring.pop_front();
  }
}

void write(Level level, std::string_view msg) {
  const std::string line = "[" + stamp("%Y-%m-%d %H:%M:%S") + "][" + level_tag(level) + "] " + std::string(msg);
  std::lock_guard<std::mutex> lock(g_mutex);
  if (static_cast<int>(level) >= static_cast<int>(g_console_level)) {
    std::cerr << line << "\n";
  }
  record(line);
}

void on_crash(int sig) {
  write(Level::Error, "xstory crashed, signal " + std::to_string(sig));
  std::_Exit(128 + sig);
}
} // namespace

void init(const std::string& app_name, const std::filesystem::path& logs_dir) {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_app = app_name;
  if (g_file.is_open()) {
    g_file.close();
  }
  g_file_path.clear();
  if (!logs_dir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(logs_dir, ec);
    const auto path = logs_dir / (g_app + "_" + stamp("%Y%m%d_%H%M%S") + ".log");
    if (!ec) {
      g_file.open(path, std::ios::out | std::ios::app);
    }
    if (g_file.is_open()) {
      g_file_path = path;
    } else {
      std::cerr << "warning: cannot open log file in " << logs_dir.string() << "\n";
    }
  }
  record("[" + stamp("%Y-%m-%d %H:%M:%S") + "][INFO] " + g_app + " started");
}

void shutdown() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_file.is_open()) {
    record("[" + stamp("%Y-%m-%d %H:%M:%S") + "][INFO] " + g_app + " finished");
    g_file.close();
  }
}

void install_crash_handlers() {
  std::signal(SIGSEGV, on_crash);
  std::signal(SIGABRT, on_crash);
  std::signal(SIGFPE, on_crash);
  std::signal(SIGILL, on_crash);
}

void set_console_level(Level level) {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_console_level = level;
}

Level console_level() {
  std::lock_guard<std::mutex> lock(g_mutex);
  return g_console_level;
}

void info(std::string_view msg) {
  write(Level::Info, msg);
}

void warn(std::string_view msg) {
  write(Level::Warn, msg);
}

void error(std::string_view msg) {
  write(Level::Error, msg);
}

std::vector<std::string> recent(size_t max_entries) {
  std::lock_guard<std::mutex> lock(g_mutex);
  const size_t count = std::min(max_entries, g_ring.size());
  return std::vector<std::string>(g_ring.end() - static_cast<std::ptrdiff_t>(count), g_ring.end());
}

const std::filesystem::path& current_log_file() {
  return g_file_path;
}

} // namespace xstory::log
