#pragma once

#include <string>

struct sqlite3;

namespace xstory::data {

class IDatabase {
 public:
  virtual ~IDatabase() = default;
  virtual bool open(const std::string& path) = 0;
  virtual bool exec(const std::string& sql) = 0;
  virtual const std::string& last_error() const = 0;
};

class SqliteDatabase final : public IDatabase {
 public:
  SqliteDatabase() = default;
  ~SqliteDatabase() override;

  SqliteDatabase(const SqliteDatabase&) = delete;
  SqliteDatabase& operator=(const SqliteDatabase&) = delete;

  bool open(const std::string& path) override;
  bool exec(const std::string& sql) override;
  const std::string& last_error() const override { return last_error_; }
  void close();

 private:
  sqlite3* db_ = nullptr;
  std::string last_error_;
};

} // namespace xstory::data
