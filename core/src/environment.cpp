#include "xstory/environment.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>

namespace xstory {

namespace fs = std::filesystem;

namespace {
std::string get_env(const char* name) {
  const char* value = std::getenv(name);
  return value ? std::string(value) : std::string();
}

std::string to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}
} // namespace

HostPlatform host_platform() {
#if defined(_WIN32)
  return HostPlatform::Windows;
#elif defined(__APPLE__)
  return HostPlatform::MacOS;
#elif defined(__linux__)
  return HostPlatform::Linux;
#else
  return HostPlatform::Other;
#endif
}

EnvironmentSignals current_environment() {
  EnvironmentSignals env;
  env.ci = get_env("CI");
  env.force_symlinks = !get_env("FORCE_SYMLINKS").empty();
  env.platform = host_platform();
  return env;
}

ProvisionMode detect_mode(bool explicit_ci, const EnvironmentSignals& env) {
  if (explicit_ci) {
    return ProvisionMode::Copy;
  }
  if (to_lower(env.ci) == "true") {
    return ProvisionMode::Copy;
  }
  // Linux hosts are treated as CI runners unless symlinks are forced.
  if (env.platform == HostPlatform::Linux && !env.force_symlinks) {
    return ProvisionMode::Copy;
  }
  return ProvisionMode::Symlink;
}

const char* mode_name(ProvisionMode mode) {
  switch (mode) {
    case ProvisionMode::Symlink:
      return "symlink";
    case ProvisionMode::Copy:
      return "copy";
  }
  return "unknown";
}

bool symlinks_supported(std::string& error) {
  error.clear();
  std::error_code ec;
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path probe_root = fs::temp_directory_path(ec) / ("xstory_symlink_probe_" + std::to_string(stamp));
  if (ec) {
    error = "temp directory unavailable: " + ec.message();
    return false;
  }
  const fs::path probe_target = probe_root / "target";
  const fs::path probe_link = probe_root / "link";

  bool ok = fs::create_directories(probe_target, ec);
  if (!ok || ec) {
    error = "probe setup failed: " + ec.message();
    fs::remove_all(probe_root, ec);
    return false;
  }
  fs::create_directory_symlink(probe_target, probe_link, ec);
  if (ec) {
    error = ec.message();
    ok = false;
  }
  std::error_code cleanup_ec;
  fs::remove_all(probe_root, cleanup_ec);
  return ok;
}

} // namespace xstory
