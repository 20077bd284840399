#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "xstory/categories.h"
#include "xstory/config.h"
#include "xstory/environment.h"

namespace xstory {

struct InstallContext {
  std::filesystem::path source_root;
  std::filesystem::path target_root;
  SetupConfig config;
};

enum class InstallAction {
  Linked,
  Copied
};

struct InstalledEntry {
  std::string name;
  InstallAction action = InstallAction::Copied;
};

struct CategoryInstallResult {
  std::string category;
  bool ok = false;
  std::string error;
  std::vector<InstalledEntry> installed;
};

struct InstallSummary {
  bool ok = true;
  std::vector<CategoryInstallResult> categories;
  size_t linked = 0;
  size_t copied = 0;
};

// Source category directories that do not exist, in registry order.
std::vector<std::filesystem::path> missing_source_dirs(const std::filesystem::path& source_root,
                                                       const SetupConfig& cfg);

// Removes whatever is at path (file, symlink, or directory tree) without
// following symlinks. Absent paths are not an error.
bool remove_existing(const std::filesystem::path& path, std::string& error);

CategoryInstallResult install_category(const Category& category, const InstallContext& ctx, ProvisionMode mode);

// Every category in registry order; stops at the first failing category.
InstallSummary install_all(const InstallContext& ctx, ProvisionMode mode);

// Copy-only categories (CI workflows and actions).
InstallSummary sync_always_copy(const InstallContext& ctx);

} // namespace xstory
