#include "xstory_data/database_init.h"

#include "xstory/categories.h"
#include "xstory/log.h"
#include "xstory_data/database.h"
#include "xstory_data/serialization.h"

namespace xstory::data {

namespace fs = std::filesystem;

fs::path database_path(const fs::path& target, const SetupConfig& cfg) {
  const Category* data = find_category("data");
  const fs::path dir = data ? category_dest_dir(*data, target, cfg) : target / cfg.bundle_dir / "data";
  return dir / cfg.database.file;
}

InitDbResult init_database(const fs::path& source_root, const fs::path& target, const SetupConfig& cfg,
                           bool overwrite) {
  InitDbResult result;
  result.database = database_path(target, cfg);

  std::error_code ec;
  fs::create_directories(result.database.parent_path(), ec);
  if (ec) {
    result.error = "cannot create " + result.database.parent_path().string() + ": " + ec.message();
    return result;
  }

  const auto existing = fs::symlink_status(result.database, ec);
  if (fs::exists(existing)) {
    if (!overwrite) {
      result.status = InitDbStatus::Skipped;
      log::info("database exists, skipping: " + result.database.string());
      return result;
    }
    fs::remove(result.database, ec);
    if (ec) {
      result.error = "cannot replace " + result.database.string() + ": " + ec.message();
      return result;
    }
  }

  const fs::path template_file = source_root / cfg.database.template_path;
  if (fs::is_regular_file(template_file, ec)) {
    fs::copy_file(template_file, result.database, fs::copy_options::overwrite_existing, ec);
    if (ec) {
      result.error = "template copy failed: " + ec.message();
      return result;
    }
    result.status = InitDbStatus::CreatedFromTemplate;
    log::info("initialized database from template: " + result.database.string());
    return result;
  }

  const fs::path schema_file = source_root / cfg.database.schema_path;
  if (!fs::is_regular_file(schema_file, ec)) {
    result.error = "no template or schema found to initialize database";
    return result;
  }

  std::string schema;
  if (!read_text_file(schema_file, schema)) {
    result.error = "cannot read schema: " + schema_file.string();
    return result;
  }

  SqliteDatabase db;
  if (!db.open(result.database.string()) || !db.exec(schema)) {
    result.error = "schema execution failed: " + db.last_error();
    db.close();
    fs::remove(result.database, ec);
    return result;
  }
  db.close();
  result.status = InitDbStatus::CreatedFromSchema;
  log::info("initialized database from schema: " + result.database.string());
  return result;
}

} // namespace xstory::data
