#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace xstory {

struct ProcessResult {
  bool started = false;
  int exit_code = -1;
  std::string output;
  std::string error_message;
};

// Runs args[0] (looked up on PATH) and blocks until it exits. stdout is
// captured; stderr is captured too when merge_stderr is set, otherwise
// discarded.
ProcessResult run_process(const std::vector<std::string>& args,
                          const std::filesystem::path& cwd,
                          bool merge_stderr);

std::optional<std::filesystem::path> find_executable(const std::string& name);

} // namespace xstory
