#include "xstory/categories.h"

#include <algorithm>

namespace xstory {

namespace fs = std::filesystem;

const std::vector<Category>& categories() {
  static const std::vector<Category> kCategories = {
      {CategoryKind::Skills, "skills", DestinationRoot::Bundle, Membership::Directory, {}, true},
      {CategoryKind::Commands, "commands", DestinationRoot::Bundle, Membership::FileWithExtension, {".md"}, true},
      {CategoryKind::Scripts, "scripts", DestinationRoot::Bundle, Membership::FileWithExtension, {".py"}, true},
      {CategoryKind::Data, "data", DestinationRoot::Bundle, Membership::FileWithExtension, {".py"}, true},
      // The CI host reads workflow and action files literally; links are not followed.
      {CategoryKind::Workflows, "workflows", DestinationRoot::CiPlatform, Membership::FileWithExtension,
       {".yml", ".yaml"}, false},
      {CategoryKind::Actions, "actions", DestinationRoot::CiPlatform, Membership::Directory, {}, false},
  };
  return kCategories;
}

const Category* find_category(const std::string& name) {
  for (const auto& category : categories()) {
    if (category.name == name) return &category;
  }
  return nullptr;
}

std::vector<Category> always_copy_categories() {
  std::vector<Category> out;
  for (const auto& category : categories()) {
    if (!category.symlink_eligible) out.push_back(category);
  }
  return out;
}

bool category_matches(const Category& category, const fs::directory_entry& entry) {
  std::error_code ec;
  switch (category.membership) {
    case Membership::Directory:
      return entry.is_directory(ec);
    case Membership::FileWithExtension: {
      if (!entry.is_regular_file(ec)) return false;
      const std::string ext = entry.path().extension().string();
      return std::find(category.extensions.begin(), category.extensions.end(), ext) !=
             category.extensions.end();
    }
  }
  return false;
}

fs::path category_source_dir(const Category& category, const fs::path& source_root, const SetupConfig& cfg) {
  switch (category.root) {
    case DestinationRoot::Bundle:
      return source_root / cfg.bundle_source / category.name;
    case DestinationRoot::CiPlatform:
      return source_root / cfg.ci_source / category.name;
  }
  return source_root / category.name;
}

fs::path category_dest_dir(const Category& category, const fs::path& target_root, const SetupConfig& cfg) {
  switch (category.root) {
    case DestinationRoot::Bundle:
      return target_root / cfg.bundle_dir / category.name;
    case DestinationRoot::CiPlatform:
      return target_root / cfg.ci_dir / category.name;
  }
  return target_root / category.name;
}

std::vector<std::string> expected_names(const Category& category,
                                        const fs::path& source_root,
                                        const SetupConfig& cfg) {
  std::vector<std::string> names;
  const fs::path src_dir = category_source_dir(category, source_root, cfg);
  std::error_code ec;
  if (!fs::is_directory(src_dir, ec)) {
    return names;
  }
  for (auto it = fs::directory_iterator(src_dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
    if (category_matches(category, *it)) {
      names.push_back(it->path().filename().string());
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

} // namespace xstory
