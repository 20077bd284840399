#pragma once

#include <cstddef>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include "xstory/config.h"
#include "xstory/environment.h"

namespace xstory {

enum class ItemState {
  Valid,
  Broken,
  TextPlaceholder,
  Missing,
  Extra
};

struct CategoryHealth {
  std::string category;
  bool expects_links = false;
  bool dest_exists = false;
  std::set<std::string> valid;
  std::set<std::string> broken;
  std::set<std::string> text_placeholder;
  std::set<std::string> missing;
  std::set<std::string> extra;

  size_t issues() const { return broken.size() + text_placeholder.size() + missing.size() + extra.size(); }
};

struct HealthReport {
  std::vector<CategoryHealth> categories;

  const CategoryHealth* find(const std::string& name) const;
};

struct VerifySummary {
  size_t valid = 0;
  size_t broken = 0;
  std::vector<std::string> broken_items;
};

// A regular file standing in for a symlink that git checked out as text.
// Approximate by nature: any small file whose content carries one of the
// rule's markers is accepted.
bool is_text_placeholder(const std::filesystem::path& path, const PlaceholderRule& rule);

HealthReport analyze(const std::filesystem::path& target,
                     const std::filesystem::path& source_root,
                     const SetupConfig& cfg,
                     ProvisionMode expected);

VerifySummary verify(const HealthReport& report);

size_t issue_count(const HealthReport& report);

// Deletes text placeholders from the symlink-eligible destination dirs.
size_t clean_text_placeholders(const std::filesystem::path& target, const SetupConfig& cfg);

const char* item_state_name(ItemState state);

} // namespace xstory
