#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace aggregator::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    AGGREGATOR_LOG_ERROR("sqlite rollback failed", {observability::StringField("path", db_->Path()), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (finished_) throw std::logic_error("sqlite transaction: commit after the transaction finished");
  // On failure the transaction stays open and the destructor rolls it back.
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  if (finished_) throw std::logic_error("sqlite transaction: rollback after the transaction finished");
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace aggregator::db::sqlite
