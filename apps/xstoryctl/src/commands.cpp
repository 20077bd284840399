#include "xstoryctl/cli_api.h"

#include "xstory/config.h"
#include "xstory/dependents.h"
#include "xstory/environment.h"
#include "xstory/git_config.h"
#include "xstory/health.h"
#include "xstory/paths.h"
#include "xstory/provision.h"
#include "xstory_data/database_init.h"

#include <iostream>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

const std::string kRule(40, '=');
const std::string kThinRule(50, '-');

struct Session {
  xstory::ResolvedPaths paths;
  xstory::SetupConfig config;
};

Session open_session(const xstory::ResolvedPaths& paths) {
  Session s;
  s.paths = paths;
  s.config = xstory::load_setup_config(s.paths.config_file);
  return s;
}

bool require_target(const fs::path& target) {
  std::error_code ec;
  if (!fs::is_directory(target, ec)) {
    std::cout << "\nError: Target directory does not exist: " << target.string() << "\n";
    return false;
  }
  return true;
}

bool check_source_directories(const Session& s) {
  const auto missing = xstory::missing_source_dirs(s.paths.source_root, s.config);
  if (missing.empty()) {
    return true;
  }
  std::cout << "\nError: bundle source directories not found:\n";
  for (const auto& dir : missing) {
    std::cout << "  - " << dir.string() << "\n";
  }
  std::cout << "\nThis usually means the submodule is not initialized.\n"
            << "Run: git submodule update --init --recursive\n";
  return false;
}

bool confirm(const std::string& question) {
  std::cout << question << " [y/N]: " << std::flush;
  std::string answer;
  if (!std::getline(std::cin, answer)) {
    return false;
  }
  return answer == "y" || answer == "Y";
}

int run_init_db(const Session& s, const fs::path& target, bool force) {
  const fs::path db = xstory::data::database_path(target, s.config);
  bool overwrite = force;
  std::error_code ec;
  if (!force && fs::exists(db, ec)) {
    std::cout << "\nDatabase already exists: " << db.string() << "\n";
    overwrite = confirm("Overwrite?");
    if (!overwrite) {
      std::cout << "Skipping database initialization.\n";
      return 0;
    }
  }

  const auto result = xstory::data::init_database(s.paths.source_root, target, s.config, overwrite);
  switch (result.status) {
    case xstory::data::InitDbStatus::CreatedFromTemplate:
      std::cout << "\nInitialized database from template: " << result.database.string() << "\n";
      return 0;
    case xstory::data::InitDbStatus::CreatedFromSchema:
      std::cout << "\nInitialized database from schema: " << result.database.string() << "\n";
      return 0;
    case xstory::data::InitDbStatus::Skipped:
      std::cout << "Skipping database initialization.\n";
      return 0;
    case xstory::data::InitDbStatus::Failed:
      break;
  }
  std::cout << "\nError: " << result.error << "\n";
  return 1;
}

void print_install_failures(const xstory::InstallSummary& summary) {
  for (const auto& category : summary.categories) {
    if (!category.ok) {
      std::cout << "\nError installing " << category.category << ": " << category.error << "\n";
    }
  }
}

void print_register_hint() {
  std::cout << "\nRegister a project with:\n"
            << "  xstoryctl register --target /path/to/project\n";
}

bool load_registry(xstory::DependentsRegistry& registry) {
  std::string error;
  if (!registry.load(error)) {
    std::cout << "Error: " << error << "\n";
    return false;
  }
  return true;
}

bool save_registry(const xstory::DependentsRegistry& registry) {
  std::string error;
  if (!registry.save(error)) {
    std::cout << "Error: " << error << "\n";
    return false;
  }
  std::cout << "Saved to: " << registry.file().string() << "\n";
  return true;
}

void print_names(const char* label, const std::set<std::string>& names) {
  if (names.empty()) return;
  std::cout << "      " << label << ":";
  for (const auto& name : names) {
    std::cout << " " << name;
  }
  std::cout << "\n";
}

} // namespace

int cmd_install(const xstory::ResolvedPaths& paths, const fs::path& target_arg,
                const InstallOptions& opts) {
  const Session s = open_session(paths);
  const fs::path target = xstory::normalize_target(target_arg);
  const auto mode = xstory::detect_mode(opts.ci, xstory::current_environment());
  const bool use_symlinks = mode == xstory::ProvisionMode::Symlink;

  std::cout << "Bundle Installation\n"
            << kRule << "\n"
            << "Source: " << s.paths.source_root.string() << "\n"
            << "Target: " << target.string() << "\n"
            << "Mode: " << (use_symlinks ? "Symlink (Local Dev)" : "Copy (CI)") << "\n";

  if (!require_target(target) || !check_source_directories(s)) {
    return 1;
  }

  if (use_symlinks) {
    std::string probe_error;
    if (!xstory::symlinks_supported(probe_error)) {
      std::cout << "\nError: Cannot create symlinks on this host (" << probe_error << ").\n";
      if (xstory::host_platform() == xstory::HostPlatform::Windows) {
        std::cout << "Please enable Developer Mode:\n"
                  << "  Settings > Privacy & Security > For developers > Developer Mode: ON\n";
      }
      std::cout << "\nAlternatively, run with --ci to copy files instead of symlinking.\n";
      return 1;
    }

    std::cout << "\nConfiguring git...\n";
    xstory::GitCliConfig git(target);
    const auto reconciled = xstory::reconcile(target, git);
    for (const auto& warning : reconciled.warnings) {
      std::cout << "  Note: " << warning << "\n";
    }
    if (reconciled.symlinks_changed) {
      std::cout << "  Set core.symlinks = true\n";
    }
    if (reconciled.recurse_changed) {
      std::cout << "  Set submodule.recurse = true (git pull will auto-update submodules)\n";
    }
    if (!reconciled.skipped && !reconciled.symlinks_changed && !reconciled.recurse_changed) {
      std::cout << "  Git already configured correctly\n";
    }

    const size_t cleaned = xstory::clean_text_placeholders(target, s.config);
    if (cleaned > 0) {
      std::cout << "\nCleaned " << cleaned << " text placeholder(s) from a previous checkout\n";
    }
  }

  const xstory::InstallContext ctx{s.paths.source_root, target, s.config};
  const auto summary = xstory::install_all(ctx, mode);
  for (const auto& category : summary.categories) {
    if (category.ok) {
      std::cout << "Installed " << category.category << ": " << category.installed.size() << " item(s)\n";
    }
  }
  if (!summary.ok) {
    print_install_failures(summary);
    return 1;
  }

  if (opts.init_db && run_init_db(s, target, opts.force) != 0) {
    return 1;
  }

  if (use_symlinks) {
    std::cout << "\nVerifying installation...\n";
    const auto verified = xstory::verify(xstory::analyze(target, s.paths.source_root, s.config, mode));
    if (verified.broken > 0) {
      std::cout << "  Warning: " << verified.broken << " broken symlink(s) detected\n";
      for (const auto& item : verified.broken_items) {
        std::cout << "    " << item << "\n";
      }
    } else {
      std::cout << "  All " << verified.valid << " item(s) verified successfully\n";
    }
  }

  std::cout << "\n" << kRule << "\nInstallation complete!\n";
  if (use_symlinks) {
    std::cout << "\nSymlinks created. Changes to the bundle will reflect immediately.\n";
  } else {
    std::cout << "\nFiles copied. Run 'xstoryctl sync-workflows' after bundle updates.\n";
  }
  return 0;
}

int cmd_sync_workflows(const xstory::ResolvedPaths& paths, const fs::path& target_arg) {
  const Session s = open_session(paths);
  const fs::path target = xstory::normalize_target(target_arg);
  if (!require_target(target)) {
    return 1;
  }

  std::cout << "Syncing workflows to " << target.string() << "\n";
  const auto summary = xstory::sync_always_copy({s.paths.source_root, target, s.config});
  if (!summary.ok) {
    print_install_failures(summary);
    return 1;
  }
  std::cout << "Workflow sync complete! (" << summary.copied << " item(s) copied)\n";
  return 0;
}

int cmd_init_db(const xstory::ResolvedPaths& paths, const fs::path& target_arg, bool force) {
  const Session s = open_session(paths);
  const fs::path target = xstory::normalize_target(target_arg);
  if (!require_target(target)) {
    return 1;
  }
  return run_init_db(s, target, force);
}

int cmd_diagnose(const xstory::ResolvedPaths& paths, const fs::path& target_arg,
                 const DiagnoseOptions& opts) {
  const Session s = open_session(paths);
  const fs::path target = xstory::normalize_target(target_arg);
  if (!require_target(target)) {
    return 1;
  }
  const auto mode = xstory::detect_mode(opts.ci, xstory::current_environment());

  std::cout << "Bundle Diagnosis\n"
            << kRule << "\n"
            << "Source: " << s.paths.source_root.string() << "\n"
            << "Target: " << target.string() << "\n"
            << "Expected mode: " << xstory::mode_name(mode) << "\n";

  size_t issues = 0;

  std::cout << "\nContent store:\n";
  const auto missing_sources = xstory::missing_source_dirs(s.paths.source_root, s.config);
  if (missing_sources.empty()) {
    std::cout << "  source directories: ok\n";
  }
  for (const auto& dir : missing_sources) {
    std::cout << "  source directory missing: " << dir.string() << "\n";
    ++issues;
  }
  std::error_code ec;
  const fs::path submodule = target / s.config.submodule_dir;
  if (fs::exists(submodule, ec)) {
    std::cout << "  " << s.config.submodule_dir << ": present\n";
  } else {
    std::cout << "  " << s.config.submodule_dir << ": not found in target\n";
  }

  std::cout << "\nGit configuration:\n";
  xstory::GitCliConfig git(target);
  if (opts.fix) {
    const auto reconciled = xstory::reconcile(target, git);
    if (reconciled.symlinks_changed) std::cout << "  fixed: core.symlinks = true\n";
    if (reconciled.recurse_changed) std::cout << "  fixed: submodule.recurse = true\n";
  }
  for (const auto& setting : xstory::inspect_git_settings(target, git)) {
    std::cout << "  " << setting.key << ": " << xstory::setting_status_name(setting.status);
    if (setting.value.has_value()) {
      std::cout << " (" << setting.value.value() << ")";
    }
    if (!setting.message.empty()) {
      std::cout << " - " << setting.message;
    }
    std::cout << "\n";
    if (setting.status != xstory::SettingStatus::Ok) {
      ++issues;
    }
  }

  std::cout << "\nInstalled content:\n";
  const auto report = xstory::analyze(target, s.paths.source_root, s.config, mode);
  for (const auto& c : report.categories) {
    std::cout << "  " << c.category << ": " << c.valid.size() << " valid, " << c.broken.size() << " broken, "
              << c.text_placeholder.size() << " text placeholder, " << c.missing.size() << " missing, "
              << c.extra.size() << " extra\n";
    print_names(xstory::item_state_name(xstory::ItemState::Broken), c.broken);
    print_names(xstory::item_state_name(xstory::ItemState::TextPlaceholder), c.text_placeholder);
    print_names(xstory::item_state_name(xstory::ItemState::Missing), c.missing);
    print_names(xstory::item_state_name(xstory::ItemState::Extra), c.extra);
  }
  issues += xstory::issue_count(report);

  std::cout << "\n" << kRule << "\n";
  if (issues == 0) {
    std::cout << "No issues found.\n";
    return 0;
  }
  std::cout << "Found " << issues << " issue(s).\n"
            << "\nSuggested fixes:\n";
  if (!missing_sources.empty()) {
    std::cout << "  - Initialize the bundle submodule: git submodule update --init --recursive\n";
  }
  std::cout << "  - Re-run install: xstoryctl install --target " << target.string()
            << (mode == xstory::ProvisionMode::Copy ? " --ci" : "") << "\n";
  if (!opts.fix) {
    std::cout << "  - Repair git settings in place: xstoryctl diagnose --target " << target.string() << " --fix\n";
  }
  return 0;
}

int cmd_register(const xstory::ResolvedPaths& paths, const fs::path& target_arg,
                 const std::optional<std::string>& name) {
  const Session s = open_session(paths);
  const fs::path target = xstory::normalize_target(target_arg);
  std::error_code ec;
  if (!fs::is_directory(target, ec)) {
    std::cout << "Error: Directory does not exist: " << target.string() << "\n";
    return 1;
  }
  if (!fs::exists(target / s.config.submodule_dir, ec)) {
    std::cout << "Warning: No " << s.config.submodule_dir << " submodule found in " << target.string() << "\n";
  }

  xstory::DependentsRegistry registry(xstory::registry_path(s.paths.source_root, s.config));
  if (!load_registry(registry)) {
    return 1;
  }
  if (registry.add(target, name) == xstory::RegisterOutcome::AlreadyRegistered) {
    std::cout << "Already registered: " << target.string() << "\n";
    return 0;
  }
  if (!save_registry(registry)) {
    return 1;
  }
  std::cout << "Registered: " << registry.entries().back().name << " (" << target.string() << ")\n";
  return 0;
}

int cmd_unregister(const xstory::ResolvedPaths& paths, const fs::path& target_arg) {
  const Session s = open_session(paths);
  const fs::path target = xstory::normalize_target(target_arg);
  xstory::DependentsRegistry registry(xstory::registry_path(s.paths.source_root, s.config));
  if (!load_registry(registry)) {
    return 1;
  }
  if (!registry.remove(target)) {
    std::cout << "Not found in registry: " << target.string() << "\n";
    return 0;
  }
  if (!save_registry(registry)) {
    return 1;
  }
  std::cout << "Unregistered: " << target.string() << "\n";
  return 0;
}

int cmd_list_dependents(const xstory::ResolvedPaths& paths) {
  const Session s = open_session(paths);
  xstory::DependentsRegistry registry(xstory::registry_path(s.paths.source_root, s.config));
  if (!load_registry(registry)) {
    return 1;
  }
  const auto statuses = registry.list();
  if (statuses.empty()) {
    std::cout << "No dependent projects registered.\n";
    print_register_hint();
    return 0;
  }
  std::cout << "Registered dependents (" << statuses.size() << "):\n" << kThinRule << "\n";
  for (const auto& status : statuses) {
    std::cout << "  " << status.entry.name << ": " << status.entry.path << (status.exists ? "" : " [NOT FOUND]")
              << "\n";
  }
  return 0;
}

int cmd_update_all(const xstory::ResolvedPaths& paths) {
  const Session s = open_session(paths);
  xstory::DependentsRegistry registry(xstory::registry_path(s.paths.source_root, s.config));
  if (!load_registry(registry)) {
    return 1;
  }
  if (registry.entries().empty()) {
    std::cout << "No dependent projects registered.\n";
    print_register_hint();
    return 0;
  }

  std::cout << "Updating workflows for " << registry.entries().size() << " project(s)...\n"
            << std::string(50, '=') << "\n";
  const auto outcomes = xstory::update_all(registry, s.paths.source_root, s.config);

  size_t success = 0;
  for (const auto& outcome : outcomes) {
    std::cout << "\n[" << outcome.entry.name << "] " << outcome.entry.path << "\n";
    switch (outcome.status) {
      case xstory::UpdateStatus::Ok:
        ++success;
        std::cout << "  OK: Workflows synced\n";
        break;
      case xstory::UpdateStatus::SkippedNotFound:
        std::cout << "  SKIPPED: Directory not found\n";
        break;
      case xstory::UpdateStatus::Error:
        std::cout << "  ERROR: " << outcome.detail << "\n";
        break;
    }
  }

  std::cout << "\n" << std::string(50, '=') << "\n"
            << "Updated " << success << "/" << outcomes.size() << " projects\n";
  if (success > 0) {
    std::cout << "\nNext steps:\n"
              << "  1. Review changes in each project: git diff " << s.config.ci_dir << "/\n"
              << "  2. Commit and push: git add " << s.config.ci_dir
              << "/ && git commit -m 'chore: sync bundle workflows'\n";
  }
  return 0;
}

void print_usage() {
  std::cout << "Usage:\n"
            << "  xstoryctl install --target <dir> [--ci] [--init-db] [--force]\n"
            << "  xstoryctl sync-workflows --target <dir>\n"
            << "  xstoryctl init-db --target <dir> [--force]\n"
            << "  xstoryctl diagnose --target <dir> [--ci] [--fix]\n"
            << "  xstoryctl register --target <dir> [--name <name>]\n"
            << "  xstoryctl unregister --target <dir>\n"
            << "  xstoryctl list-dependents\n"
            << "  xstoryctl update-all\n"
            << "\nCommon options:\n"
            << "  --source <dir>    bundle root (default: XSTORY_ROOT or the executable's ancestors)\n"
            << "  --config <file>   setup config (default: <source>/config/setup.yaml)\n"
            << "  -v, --verbose     echo every logged event, not only warnings and errors\n";
}
