#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "xstory/config.h"

namespace xstory {

struct DependentEntry {
  std::string name;
  std::string path;
};

struct DependentStatus {
  DependentEntry entry;
  bool exists = false;
};

enum class RegisterOutcome {
  Registered,
  AlreadyRegistered
};

enum class UpdateStatus {
  Ok,
  SkippedNotFound,
  Error
};

struct DependentOutcome {
  DependentEntry entry;
  UpdateStatus status = UpdateStatus::Error;
  std::string detail;
};

// JSON array of {"name", "path"} objects, read whole and rewritten whole.
// Not safe against concurrent writers.
class DependentsRegistry {
 public:
  explicit DependentsRegistry(std::filesystem::path file);

  bool load(std::string& error);
  bool save(std::string& error) const;

  RegisterOutcome add(const std::filesystem::path& path, const std::optional<std::string>& name);
  bool remove(const std::filesystem::path& path);

  std::vector<DependentStatus> list() const;
  const std::vector<DependentEntry>& entries() const { return entries_; }
  const std::filesystem::path& file() const { return file_; }

 private:
  std::filesystem::path file_;
  std::vector<DependentEntry> entries_;
};

std::string default_dependent_name(const std::filesystem::path& path);

// Re-syncs the copy-only categories into every registered dependent. Each
// entry is independent; earlier successes stay applied when a later one fails.
std::vector<DependentOutcome> update_all(const DependentsRegistry& registry,
                                         const std::filesystem::path& source_root,
                                         const SetupConfig& cfg);

const char* update_status_name(UpdateStatus status);

} // namespace xstory
