#include "xstory/paths.h"

#include "xstory/log.h"

#include <cstdlib>

#if defined(_WIN32)
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace xstory {

namespace {
std::filesystem::path executable_dir(const char* argv0) {
#if defined(_WIN32)
  char buffer[MAX_PATH];
  DWORD len = GetModuleFileNameA(nullptr, buffer, MAX_PATH);
  if (len > 0) {
    return std::filesystem::path(buffer).parent_path();
  }
#elif defined(__linux__)
  char buffer[4096];
  const ssize_t len = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
  if (len > 0) {
    buffer[len] = '\0';
    return std::filesystem::path(buffer).parent_path();
  }
#endif
  if (argv0) {
    return std::filesystem::absolute(argv0).parent_path();
  }
  return std::filesystem::current_path();
}

bool looks_like_bundle_root(const std::filesystem::path& dir) {
  std::error_code ec;
  return std::filesystem::is_directory(dir / "claude", ec) &&
         std::filesystem::is_directory(dir / "github", ec);
}

std::filesystem::path find_root_from(const std::filesystem::path& start) {
  std::filesystem::path cur = start;
  for (int i = 0; i < 6; ++i) {
    if (looks_like_bundle_root(cur)) {
      return cur;
    }
    if (cur.has_parent_path() && cur.parent_path() != cur) {
      cur = cur.parent_path();
    } else {
      break;
    }
  }
  return start;
}
} // namespace

ResolvedPaths resolve_paths(const char* argv0,
                            const std::optional<std::filesystem::path>& source_override,
                            const std::optional<std::filesystem::path>& config_override) {
  ResolvedPaths out;
  if (source_override.has_value()) {
    out.source_root = std::filesystem::absolute(source_override.value()).lexically_normal();
  } else if (const char* env_root = std::getenv("XSTORY_ROOT")) {
    out.source_root = std::filesystem::path(env_root);
  } else {
    out.source_root = find_root_from(executable_dir(argv0));
  }

  if (config_override.has_value()) {
    out.config_file = config_override.value();
  } else {
    out.config_file = out.source_root / "config" / "setup.yaml";
  }
  out.logs_dir = out.source_root / "build" / "logs";

  if (!looks_like_bundle_root(out.source_root)) {
    log::warn(std::string("bundle sources not found under: ") + out.source_root.string());
  }
  return out;
}

std::filesystem::path normalize_target(const std::filesystem::path& path) {
  std::error_code ec;
  auto abs = std::filesystem::absolute(path, ec);
  if (ec) {
    return path.lexically_normal();
  }
  auto canonical = std::filesystem::weakly_canonical(abs, ec);
  if (ec) {
    return abs.lexically_normal();
  }
  std::string text = canonical.string();
  while (text.size() > 1 && (text.back() == '/' || text.back() == '\\')) {
    text.pop_back();
  }
  return std::filesystem::path(text);
}

} // namespace xstory
