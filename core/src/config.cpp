#include "xstory/config.h"

#include "xstory/log.h"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <optional>

namespace xstory {

namespace {
bool file_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

struct RawFields {
  std::string bundle_dir;
  std::string ci_dir;
  std::string bundle_source;
  std::string ci_source;
  std::string submodule_dir;
  std::string registry_file;
  std::optional<int64_t> placeholder_max_bytes;
  std::vector<std::string> placeholder_markers;
  std::string db_file;
  std::string db_template;
  std::string db_schema;
};

void apply_fields(SetupConfig& cfg, const RawFields& raw) {
  if (!raw.bundle_dir.empty()) cfg.bundle_dir = raw.bundle_dir;
  if (!raw.ci_dir.empty()) cfg.ci_dir = raw.ci_dir;
  if (!raw.bundle_source.empty()) cfg.bundle_source = raw.bundle_source;
  if (!raw.ci_source.empty()) cfg.ci_source = raw.ci_source;
  if (!raw.submodule_dir.empty()) cfg.submodule_dir = raw.submodule_dir;
  if (!raw.registry_file.empty()) cfg.registry_file = raw.registry_file;
  if (raw.placeholder_max_bytes.has_value() && raw.placeholder_max_bytes.value() > 0) {
    cfg.placeholder.max_bytes = static_cast<uint64_t>(raw.placeholder_max_bytes.value());
  }
  if (!raw.placeholder_markers.empty()) cfg.placeholder.markers = raw.placeholder_markers;
  if (!raw.db_file.empty()) cfg.database.file = raw.db_file;
  if (!raw.db_template.empty()) cfg.database.template_path = raw.db_template;
  if (!raw.db_schema.empty()) cfg.database.schema_path = raw.db_schema;
}

RawFields read_json_fields(const nlohmann::json& root) {
  RawFields raw;
  if (root.contains("bundle_dir")) raw.bundle_dir = root["bundle_dir"].get<std::string>();
  if (root.contains("ci_dir")) raw.ci_dir = root["ci_dir"].get<std::string>();
  if (root.contains("bundle_source")) raw.bundle_source = root["bundle_source"].get<std::string>();
  if (root.contains("ci_source")) raw.ci_source = root["ci_source"].get<std::string>();
  if (root.contains("submodule_dir")) raw.submodule_dir = root["submodule_dir"].get<std::string>();
  if (root.contains("registry_file")) raw.registry_file = root["registry_file"].get<std::string>();
  if (root.contains("placeholder") && root["placeholder"].is_object()) {
    const auto& ph = root["placeholder"];
    if (ph.contains("max_bytes")) raw.placeholder_max_bytes = ph["max_bytes"].get<int64_t>();
    if (ph.contains("markers") && ph["markers"].is_array()) {
      for (const auto& v : ph["markers"]) {
        raw.placeholder_markers.push_back(v.get<std::string>());
      }
    }
  }
  if (root.contains("database") && root["database"].is_object()) {
    const auto& db = root["database"];
    if (db.contains("file")) raw.db_file = db["file"].get<std::string>();
    if (db.contains("template")) raw.db_template = db["template"].get<std::string>();
    if (db.contains("schema")) raw.db_schema = db["schema"].get<std::string>();
  }
  return raw;
}

RawFields read_yaml_fields(const YAML::Node& root) {
  RawFields raw;
  if (root["bundle_dir"]) raw.bundle_dir = root["bundle_dir"].as<std::string>();
  if (root["ci_dir"]) raw.ci_dir = root["ci_dir"].as<std::string>();
  if (root["bundle_source"]) raw.bundle_source = root["bundle_source"].as<std::string>();
  if (root["ci_source"]) raw.ci_source = root["ci_source"].as<std::string>();
  if (root["submodule_dir"]) raw.submodule_dir = root["submodule_dir"].as<std::string>();
  if (root["registry_file"]) raw.registry_file = root["registry_file"].as<std::string>();
  if (root["placeholder"]) {
    const auto ph = root["placeholder"];
    if (ph["max_bytes"]) raw.placeholder_max_bytes = ph["max_bytes"].as<int64_t>();
    if (ph["markers"]) {
      for (const auto& v : ph["markers"]) {
        raw.placeholder_markers.push_back(v.as<std::string>());
      }
    }
  }
  if (root["database"]) {
    const auto db = root["database"];
    if (db["file"]) raw.db_file = db["file"].as<std::string>();
    if (db["template"]) raw.db_template = db["template"].as<std::string>();
    if (db["schema"]) raw.db_schema = db["schema"].as<std::string>();
  }
  return raw;
}
} // namespace

SetupConfig load_setup_config(const std::filesystem::path& path) {
  SetupConfig cfg;

  if (!file_exists(path)) {
    log::warn(std::string("setup config not found, using defaults: ") + path.string());
    return cfg;
  }

  const auto ext = path.extension().string();
  if (ext == ".json") {
    try {
      std::ifstream in(path);
      nlohmann::json j;
      in >> j;
      const auto& root = j.contains("setup") ? j["setup"] : j;
      apply_fields(cfg, read_json_fields(root));
    } catch (const nlohmann::json::exception& e) {
      log::warn(std::string("setup config parse failed: ") + e.what());
    }
    return cfg;
  }

  if (ext == ".yaml" || ext == ".yml") {
    try {
      YAML::Node doc = YAML::LoadFile(path.string());
      YAML::Node root = doc["setup"] ? doc["setup"] : doc;
      apply_fields(cfg, read_yaml_fields(root));
    } catch (const YAML::Exception& e) {
      log::warn(std::string("setup config parse failed: ") + e.what());
    }
    return cfg;
  }

  log::warn("Unknown setup config extension; using defaults.");
  return cfg;
}

std::filesystem::path registry_path(const std::filesystem::path& source_root, const SetupConfig& cfg) {
  const std::filesystem::path p(cfg.registry_file);
  if (p.is_absolute()) return p;
  return source_root / p;
}

} // namespace xstory
