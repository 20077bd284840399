#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace xstory {

inline constexpr const char* kGitSymlinksKey = "core.symlinks";
inline constexpr const char* kGitSubmoduleRecurseKey = "submodule.recurse";

// Repository-scoped git configuration access.
class GitConfigPort {
 public:
  virtual ~GitConfigPort() = default;
  virtual bool available() const = 0;
  virtual std::optional<std::string> get_local(const std::string& key) = 0;
  virtual bool set_local(const std::string& key, const std::string& value, std::string& error) = 0;
};

class GitCliConfig final : public GitConfigPort {
 public:
  explicit GitCliConfig(std::filesystem::path repo, std::string git_exe = "git");

  bool available() const override;
  std::optional<std::string> get_local(const std::string& key) override;
  bool set_local(const std::string& key, const std::string& value, std::string& error) override;

 private:
  std::filesystem::path repo_;
  std::string git_exe_;
};

struct ReconcileResult {
  bool symlinks_changed = false;
  bool recurse_changed = false;
  bool skipped = false;
  std::vector<std::string> warnings;
};

enum class SettingStatus {
  Ok,
  Warning,
  Error
};

struct GitConfigSetting {
  std::string key;
  SettingStatus status = SettingStatus::Error;
  std::optional<std::string> value;
  std::string message;
};

bool is_git_repository(const std::filesystem::path& target);

ReconcileResult reconcile(const std::filesystem::path& target, GitConfigPort& port);

std::vector<GitConfigSetting> inspect_git_settings(const std::filesystem::path& target, GitConfigPort& port);

const char* setting_status_name(SettingStatus status);

} // namespace xstory
