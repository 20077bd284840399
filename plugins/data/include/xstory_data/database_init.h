#pragma once

#include <filesystem>
#include <string>

#include "xstory/config.h"

namespace xstory::data {

enum class InitDbStatus {
  CreatedFromTemplate,
  CreatedFromSchema,
  Skipped,
  Failed
};

struct InitDbResult {
  InitDbStatus status = InitDbStatus::Failed;
  std::filesystem::path database;
  std::string error;
};

std::filesystem::path database_path(const std::filesystem::path& target, const SetupConfig& cfg);

// Leaves an existing database alone unless overwrite is set. Prefers the
// bundled empty template; falls back to running the schema script.
InitDbResult init_database(const std::filesystem::path& source_root,
                           const std::filesystem::path& target,
                           const SetupConfig& cfg,
                           bool overwrite);

} // namespace xstory::data
