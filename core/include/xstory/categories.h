#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "xstory/config.h"

namespace xstory {

enum class CategoryKind {
  Skills,
  Commands,
  Scripts,
  Data,
  Workflows,
  Actions
};

enum class DestinationRoot {
  Bundle,
  CiPlatform
};

enum class Membership {
  Directory,
  FileWithExtension
};

struct Category {
  CategoryKind kind;
  std::string name;
  DestinationRoot root;
  Membership membership;
  std::vector<std::string> extensions;
  bool symlink_eligible = false;
};

// Fixed install order: skills, commands, scripts, data, workflows, actions.
const std::vector<Category>& categories();
const Category* find_category(const std::string& name);
std::vector<Category> always_copy_categories();

bool category_matches(const Category& category, const std::filesystem::directory_entry& entry);

std::filesystem::path category_source_dir(const Category& category,
                                          const std::filesystem::path& source_root,
                                          const SetupConfig& cfg);
std::filesystem::path category_dest_dir(const Category& category,
                                        const std::filesystem::path& target_root,
                                        const SetupConfig& cfg);

// Names of source entries matching the category, sorted. Empty when the
// source directory is absent.
std::vector<std::string> expected_names(const Category& category,
                                        const std::filesystem::path& source_root,
                                        const SetupConfig& cfg);

} // namespace xstory
