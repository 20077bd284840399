#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace xstory {

struct PlaceholderRule {
  uint64_t max_bytes = 200;
  std::vector<std::string> markers = {".StoryTree/", "../"};
};

struct SetupConfig {
  struct DatabaseConfig {
    std::string file = "story-tree.db";
    std::string template_path = "templates/story-tree.db.empty";
    std::string schema_path = "claude/skills/story-tree/references/schema.sql";
  };

  std::string bundle_dir = ".claude";
  std::string ci_dir = ".github";
  std::string bundle_source = "claude";
  std::string ci_source = "github";
  std::string submodule_dir = ".StoryTree";
  std::string registry_file = "dependents.json";
  PlaceholderRule placeholder;
  DatabaseConfig database;
};

SetupConfig load_setup_config(const std::filesystem::path& path);

std::filesystem::path registry_path(const std::filesystem::path& source_root, const SetupConfig& cfg);

} // namespace xstory
