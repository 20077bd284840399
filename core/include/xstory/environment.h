#pragma once

#include <string>

namespace xstory {

enum class ProvisionMode {
  Symlink,
  Copy
};

enum class HostPlatform {
  Linux,
  Windows,
  MacOS,
  Other
};

struct EnvironmentSignals {
  std::string ci;
  bool force_symlinks = false;
  HostPlatform platform = HostPlatform::Other;
};

HostPlatform host_platform();
EnvironmentSignals current_environment();

ProvisionMode detect_mode(bool explicit_ci, const EnvironmentSignals& env);

const char* mode_name(ProvisionMode mode);

// Creates a throwaway directory symlink in a fresh temp directory.
bool symlinks_supported(std::string& error);

} // namespace xstory
