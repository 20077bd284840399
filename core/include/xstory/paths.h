#pragma once

#include <filesystem>
#include <optional>

namespace xstory {

struct ResolvedPaths {
  std::filesystem::path source_root;
  std::filesystem::path config_file;
  std::filesystem::path logs_dir;
};

// Bundle root lookup: explicit override, then XSTORY_ROOT, then the first
// ancestor of the executable that carries the bundle source directories.
ResolvedPaths resolve_paths(const char* argv0,
                            const std::optional<std::filesystem::path>& source_override,
                            const std::optional<std::filesystem::path>& config_override);

// Absolute, symlink-resolved form of a user supplied path. Falls back to the
// lexically normalized absolute path when the filesystem cannot resolve it.
std::filesystem::path normalize_target(const std::filesystem::path& path);

} // namespace xstory
