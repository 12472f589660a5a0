#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <string>

namespace aggregator::db::sqlite {

/*
  Owns the single connection of the aggregator store.

  All access is serialized by the BatchAggregator mutex, so one connection
  opened in serialized mode is enough. ":memory:" is accepted for tests and
  skips WAL.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Runs one or more statements; throws std::runtime_error with the failing SQL.
  void Exec(const std::string& sql);

  // PRAGMA user_version; tracks the bootstrapped schema.
  int64_t UserVersion();
  void    SetUserVersion(int64_t version);

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace aggregator::db::sqlite
