#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "xstory/paths.h"

struct CommonOptions {
  std::optional<std::filesystem::path> source_override;
  std::optional<std::filesystem::path> config_override;
};

struct InstallOptions {
  bool ci = false;
  bool init_db = false;
  bool force = false;
};

struct DiagnoseOptions {
  bool ci = false;
  bool fix = false;
};

int cmd_install(const xstory::ResolvedPaths& paths, const std::filesystem::path& target,
                const InstallOptions& opts);
int cmd_sync_workflows(const xstory::ResolvedPaths& paths, const std::filesystem::path& target);
int cmd_init_db(const xstory::ResolvedPaths& paths, const std::filesystem::path& target, bool force);
int cmd_diagnose(const xstory::ResolvedPaths& paths, const std::filesystem::path& target,
                 const DiagnoseOptions& opts);
int cmd_register(const xstory::ResolvedPaths& paths, const std::filesystem::path& target,
                 const std::optional<std::string>& name);
int cmd_unregister(const xstory::ResolvedPaths& paths, const std::filesystem::path& target);
int cmd_list_dependents(const xstory::ResolvedPaths& paths);
int cmd_update_all(const xstory::ResolvedPaths& paths);

void print_usage();
