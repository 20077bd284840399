#include "xstory_data/database.h"

#include "xstory/log.h"

#include <sqlite3.h>

namespace xstory::data {

bool SqliteDatabase::open(const std::string& path) {
  close();
  if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
    last_error_ = db_ ? sqlite3_errmsg(db_) : "out of memory";
    xstory::log::warn("sqlite open failed: " + last_error_);
    close();
    return false;
  }
  return true;
}

bool SqliteDatabase::exec(const std::string& sql) {
  if (!db_) {
    last_error_ = "database not open";
    return false;
  }
  char* err_msg = nullptr;
  const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    last_error_ = err_msg ? err_msg : sqlite3_errstr(rc);
    xstory::log::warn("sqlite exec error: " + last_error_);
    if (err_msg) {
      sqlite3_free(err_msg);
    }
    return false;
  }
  return true;
}

void SqliteDatabase::close() {
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

SqliteDatabase::~SqliteDatabase() {
  close();
}

} // namespace xstory::data
