#include "sqlite_db.hpp"

#include <stdexcept>

namespace aggregator::db::sqlite {

namespace {

constexpr int  kBusyTimeoutMs = 5000;
constexpr char kInMemoryPath[] = ":memory:";

void ThrowIf(int rc, sqlite3* db, const std::string& what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error("sqlite " + what + ": " + sqlite3_errmsg(db));
  }
}

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  if (path_.empty()) {
    throw std::invalid_argument("sqlite: database path must not be empty");
  }

  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = "sqlite open '" + path_ + "': " + (db_ ? sqlite3_errmsg(db_) : "out of memory");
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  try {
    Configure();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = "sqlite exec '" + sql + "': " + (err ? err : sqlite3_errstr(rc));
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

int64_t SqliteDB::UserVersion() {
  sqlite3_stmt* st = nullptr;
  ThrowIf(sqlite3_prepare_v2(db_, "PRAGMA user_version;", -1, &st, nullptr), db_, "prepare user_version");

  int64_t version = 0;
  if (sqlite3_step(st) == SQLITE_ROW) {
    version = sqlite3_column_int64(st, 0);
  }
  sqlite3_finalize(st);
  return version;
}

void SqliteDB::SetUserVersion(int64_t version) {
  Exec("PRAGMA user_version=" + std::to_string(version) + ";");
}

void SqliteDB::Configure() {
  if (path_ != kInMemoryPath) {
    Exec("PRAGMA journal_mode=WAL;");
  }

  // Finalized averages must survive a power loss once acknowledged.
  Exec("PRAGMA synchronous=FULL;");

  // Ciphertexts and contexts reference batches.
  Exec("PRAGMA foreign_keys=ON;");

  ThrowIf(sqlite3_busy_timeout(db_, kBusyTimeoutMs), db_, "busy_timeout");
}

} // namespace aggregator::db::sqlite
