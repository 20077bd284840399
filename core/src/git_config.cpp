#include "xstory/git_config.h"

#include "xstory/log.h"
#include "xstory/process.h"

#include <algorithm>
#include <cctype>

namespace xstory {

namespace fs = std::filesystem;

namespace {
std::string normalize_value(std::string text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.pop_back();
  }
  size_t start = 0;
  while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
    ++start;
  }
  text.erase(0, start);
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

// Returns true when the key was changed.
bool ensure_true(GitConfigPort& port, const char* key, std::vector<std::string>& warnings) {
  const auto current = port.get_local(key);
  if (current.has_value() && normalize_value(current.value()) == "true") {
    return false;
  }
  std::string error;
  if (!port.set_local(key, "true", error)) {
    warnings.push_back(std::string("failed to set ") + key + ": " + error);
    log::warn(std::string("git config ") + key + " not updated: " + error);
    return false;
  }
  log::info(std::string("set ") + key + " = true");
  return true;
}
} // namespace

GitCliConfig::GitCliConfig(fs::path repo, std::string git_exe)
    : repo_(std::move(repo)), git_exe_(std::move(git_exe)) {}

bool GitCliConfig::available() const {
  return find_executable(git_exe_).has_value();
}

std::optional<std::string> GitCliConfig::get_local(const std::string& key) {
  const auto result = run_process({git_exe_, "-C", repo_.string(), "config", "--local", "--get", key}, {}, false);
  // git exits 1 when the key is unset.
  if (!result.started || result.exit_code != 0) {
    return std::nullopt;
  }
  std::string value = result.output;
  while (!value.empty() && (value.back() == '\n' || value.back() == '\r')) {
    value.pop_back();
  }
  return value;
}

bool GitCliConfig::set_local(const std::string& key, const std::string& value, std::string& error) {
  const auto result = run_process({git_exe_, "-C", repo_.string(), "config", "--local", key, value}, {}, true);
  if (!result.started) {
    error = result.error_message;
    return false;
  }
  if (result.exit_code != 0) {
    error = "git config exited with " + std::to_string(result.exit_code);
    if (!result.output.empty()) {
      error += ": " + normalize_value(result.output);
    }
    return false;
  }
  return true;
}

bool is_git_repository(const fs::path& target) {
  std::error_code ec;
  // Submodule checkouts carry a .git file rather than a directory.
  return fs::exists(target / ".git", ec);
}

ReconcileResult reconcile(const fs::path& target, GitConfigPort& port) {
  ReconcileResult result;
  if (!is_git_repository(target)) {
    result.skipped = true;
    result.warnings.push_back("target is not a git repository, skipping git configuration");
    log::warn("not a git repository: " + target.string());
    return result;
  }
  if (!port.available()) {
    result.skipped = true;
    result.warnings.push_back("git not found in PATH, skipping git configuration");
    log::warn("git executable not found");
    return result;
  }

  result.symlinks_changed = ensure_true(port, kGitSymlinksKey, result.warnings);
  result.recurse_changed = ensure_true(port, kGitSubmoduleRecurseKey, result.warnings);
  return result;
}

std::vector<GitConfigSetting> inspect_git_settings(const fs::path& target, GitConfigPort& port) {
  std::vector<GitConfigSetting> out;
  const bool repo = is_git_repository(target);
  const bool git = repo && port.available();
  for (const char* key : {kGitSymlinksKey, kGitSubmoduleRecurseKey}) {
    GitConfigSetting setting;
    setting.key = key;
    if (!repo) {
      setting.status = SettingStatus::Error;
      setting.message = "not a git repository";
    } else if (!git) {
      setting.status = SettingStatus::Error;
      setting.message = "git not found";
    } else {
      setting.value = port.get_local(key);
      if (setting.value.has_value() && normalize_value(setting.value.value()) == "true") {
        setting.status = SettingStatus::Ok;
      } else {
        setting.status = SettingStatus::Warning;
        setting.message = setting.value.has_value() ? "expected true" : "not set";
      }
    }
    out.push_back(std::move(setting));
  }
  return out;
}

const char* setting_status_name(SettingStatus status) {
  switch (status) {
    case SettingStatus::Ok:
      return "ok";
    case SettingStatus::Warning:
      return "warning";
    case SettingStatus::Error:
      return "error";
  }
  return "unknown";
}

} // namespace xstory
