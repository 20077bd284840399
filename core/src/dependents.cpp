#include "xstory/dependents.h"

#include "xstory/log.h"
#include "xstory/paths.h"
#include "xstory/provision.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>

namespace xstory {

namespace fs = std::filesystem;

DependentsRegistry::DependentsRegistry(fs::path file) : file_(std::move(file)) {}

bool DependentsRegistry::load(std::string& error) {
  entries_.clear();
  std::error_code ec;
  if (!fs::exists(file_, ec)) {
    return true;
  }
  std::ifstream in(file_);
  if (!in) {
    error = "cannot open registry: " + file_.string();
    return false;
  }
  try {
    nlohmann::json doc;
    in >> doc;
    if (!doc.is_array()) {
      error = "registry is not a JSON array: " + file_.string();
      return false;
    }
    for (const auto& item : doc) {
      if (!item.is_object() || !item.contains("path")) {
        error = "registry entry without path in " + file_.string();
        entries_.clear();
        return false;
      }
      DependentEntry entry;
      entry.path = item["path"].get<std::string>();
      entry.name = item.value("name", default_dependent_name(entry.path));
      entries_.push_back(std::move(entry));
    }
  } catch (const nlohmann::json::exception& e) {
    error = std::string("registry parse failed: ") + e.what();
    entries_.clear();
    return false;
  }
  return true;
}

bool DependentsRegistry::save(std::string& error) const {
  nlohmann::json doc = nlohmann::json::array();
  for (const auto& entry : entries_) {
    doc.push_back({{"name", entry.name}, {"path", entry.path}});
  }
  std::error_code ec;
  if (file_.has_parent_path()) {
    fs::create_directories(file_.parent_path(), ec);
  }
  std::ofstream out(file_, std::ios::trunc);
  if (!out) {
    error = "cannot write registry: " + file_.string();
    return false;
  }
  out << doc.dump(2) << "\n";
  if (!out) {
    error = "registry write failed: " + file_.string();
    return false;
  }
  log::info("saved registry: " + file_.string());
  return true;
}

RegisterOutcome DependentsRegistry::add(const fs::path& path, const std::optional<std::string>& name) {
  const std::string key = normalize_target(path).string();
  for (const auto& entry : entries_) {
    if (entry.path == key) {
      return RegisterOutcome::AlreadyRegistered;
    }
  }
  DependentEntry entry;
  entry.path = key;
  entry.name = name.has_value() && !name->empty() ? name.value() : default_dependent_name(key);
  entries_.push_back(std::move(entry));
  return RegisterOutcome::Registered;
}

bool DependentsRegistry::remove(const fs::path& path) {
  const std::string key = normalize_target(path).string();
  const auto before = entries_.size();
  entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                [&](const DependentEntry& e) { return e.path == key; }),
                 entries_.end());
  return entries_.size() != before;
}

std::vector<DependentStatus> DependentsRegistry::list() const {
  std::vector<DependentStatus> out;
  out.reserve(entries_.size());
  for (const auto& entry : entries_) {
    std::error_code ec;
    out.push_back({entry, fs::exists(entry.path, ec)});
  }
  return out;
}

std::string default_dependent_name(const fs::path& path) {
  fs::path p = path;
  if (p.filename().empty() && p.has_parent_path()) {
    p = p.parent_path();
  }
  return p.filename().string();
}

std::vector<DependentOutcome> update_all(const DependentsRegistry& registry,
                                         const fs::path& source_root,
                                         const SetupConfig& cfg) {
  std::vector<DependentOutcome> outcomes;
  for (const auto& entry : registry.entries()) {
    DependentOutcome outcome;
    outcome.entry = entry;

    std::error_code ec;
    if (!fs::is_directory(entry.path, ec)) {
      outcome.status = UpdateStatus::SkippedNotFound;
      outcome.detail = "directory not found";
      log::warn("[" + entry.name + "] skipped, directory not found: " + entry.path);
      outcomes.push_back(std::move(outcome));
      continue;
    }

    try {
      const InstallContext ctx{source_root, fs::path(entry.path), cfg};
      const auto summary = sync_always_copy(ctx);
      if (summary.ok) {
        outcome.status = UpdateStatus::Ok;
        outcome.detail = std::to_string(summary.copied) + " item(s) copied";
        log::info("[" + entry.name + "] workflows synced");
      } else {
        outcome.status = UpdateStatus::Error;
        outcome.detail = summary.categories.empty() ? "sync failed" : summary.categories.back().error;
        log::error("[" + entry.name + "] " + outcome.detail);
      }
    } catch (const std::exception& e) {
      outcome.status = UpdateStatus::Error;
      outcome.detail = e.what();
      log::error("[" + entry.name + "] " + outcome.detail);
    }
    outcomes.push_back(std::move(outcome));
  }
  return outcomes;
}

const char* update_status_name(UpdateStatus status) {
  switch (status) {
    case UpdateStatus::Ok:
      return "ok";
    case UpdateStatus::SkippedNotFound:
      return "skipped-not-found";
    case UpdateStatus::Error:
      return "error";
  }
  return "unknown";
}

} // namespace xstory
