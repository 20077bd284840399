#include "xstory/health.h"

#include "xstory/categories.h"
#include "xstory/log.h"

#include <cctype>
#include <fstream>
#include <sstream>

namespace xstory {

namespace fs = std::filesystem;

namespace {
std::string trim(const std::string& text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  return text.substr(begin, end - begin);
}

void classify_symlink(const fs::directory_entry& entry, CategoryHealth& health) {
  const std::string name = entry.path().filename().string();
  std::error_code ec;
  // exists() follows the whole link chain.
  if (fs::exists(entry.path(), ec) && !ec) {
    health.valid.insert(name);
  } else {
    std::error_code read_ec;
    const auto link_target = fs::read_symlink(entry.path(), read_ec);
    log::warn("broken symlink: " + entry.path().string() + " -> " +
              (read_ec ? std::string("?") : link_target.string()));
    health.broken.insert(name);
  }
}

CategoryHealth analyze_category(const Category& category,
                                const fs::path& target,
                                const fs::path& source_root,
                                const SetupConfig& cfg,
                                ProvisionMode expected) {
  CategoryHealth health;
  health.category = category.name;
  health.expects_links = expected == ProvisionMode::Symlink && category.symlink_eligible;

  const auto names = expected_names(category, source_root, cfg);
  const std::set<std::string> expected_set(names.begin(), names.end());
  const fs::path dest_dir = category_dest_dir(category, target, cfg);

  std::error_code ec;
  health.dest_exists = fs::is_directory(dest_dir, ec);
  if (!health.dest_exists) {
    health.missing = expected_set;
    return health;
  }

  for (auto it = fs::directory_iterator(dest_dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
    const fs::directory_entry& entry = *it;
    const std::string name = entry.path().filename().string();
    std::error_code type_ec;
    if (entry.is_symlink(type_ec)) {
      classify_symlink(entry, health);
    } else if (category.symlink_eligible && is_text_placeholder(entry.path(), cfg.placeholder)) {
      // A leftover placeholder is an issue whichever mode is expected.
      health.text_placeholder.insert(name);
    } else if (expected_set.count(name) != 0) {
      if (health.expects_links) {
        health.extra.insert(name);
      } else {
        health.valid.insert(name);
      }
    }
  }
  if (ec) {
    log::warn("cannot list " + dest_dir.string() + ": " + ec.message());
  }

  for (const auto& name : expected_set) {
    if (health.valid.count(name) || health.broken.count(name) || health.text_placeholder.count(name) ||
        health.extra.count(name)) {
      continue;
    }
    health.missing.insert(name);
  }
  return health;
}
} // namespace

const CategoryHealth* HealthReport::find(const std::string& name) const {
  for (const auto& c : categories) {
    if (c.category == name) return &c;
  }
  return nullptr;
}

bool is_text_placeholder(const fs::path& path, const PlaceholderRule& rule) {
  std::error_code ec;
  const auto status = fs::symlink_status(path, ec);
  if (ec || !fs::is_regular_file(status)) {
    return false;
  }
  const auto size = fs::file_size(path, ec);
  if (ec || size > rule.max_bytes) {
    return false;
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  const std::string raw = ss.str();
  if (raw.find('\0') != std::string::npos) {
    return false;
  }

  const std::string content = trim(raw);
  for (const auto& marker : rule.markers) {
    if (!marker.empty() && content.find(marker) != std::string::npos) {
      return true;
    }
  }
  return false;
}

HealthReport analyze(const fs::path& target, const fs::path& source_root, const SetupConfig& cfg,
                     ProvisionMode expected) {
  HealthReport report;
  for (const auto& category : categories()) {
    report.categories.push_back(analyze_category(category, target, source_root, cfg, expected));
  }
  return report;
}

VerifySummary verify(const HealthReport& report) {
  VerifySummary summary;
  for (const auto& c : report.categories) {
    summary.valid += c.valid.size();
    summary.broken += c.broken.size();
    for (const auto& name : c.broken) {
      summary.broken_items.push_back(c.category + "/" + name);
    }
  }
  return summary;
}

size_t issue_count(const HealthReport& report) {
  size_t total = 0;
  for (const auto& c : report.categories) {
    total += c.issues();
  }
  return total;
}

size_t clean_text_placeholders(const fs::path& target, const SetupConfig& cfg) {
  size_t cleaned = 0;
  for (const auto& category : categories()) {
    if (!category.symlink_eligible) continue;
    const fs::path dir = category_dest_dir(category, target, cfg);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) continue;

    std::vector<fs::path> doomed;
    for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
      if (is_text_placeholder(it->path(), cfg.placeholder)) {
        doomed.push_back(it->path());
      }
    }
    for (const auto& path : doomed) {
      std::error_code rm_ec;
      if (fs::remove(path, rm_ec)) {
        log::info("removed text placeholder: " + category.name + "/" + path.filename().string());
        ++cleaned;
      } else if (rm_ec) {
        log::warn("cannot remove placeholder " + path.string() + ": " + rm_ec.message());
      }
    }
  }
  return cleaned;
}

const char* item_state_name(ItemState state) {
  switch (state) {
    case ItemState::Valid:
      return "valid";
    case ItemState::Broken:
      return "broken";
    case ItemState::TextPlaceholder:
      return "text placeholder";
    case ItemState::Missing:
      return "missing";
    case ItemState::Extra:
      return "extra";
  }
  return "unknown";
}

} // namespace xstory
