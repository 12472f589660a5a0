#pragma once

namespace aggregator::db {

/*
  Unit of atomicity for one aggregator operation.

  Every backend guarantees:
    - reads see the transaction's own writes
    - nothing is visible to other transactions before Commit()
    - Commit() throws if the backend cannot apply the writes; the
      transaction is then still active and rolls back on destruction
    - the destructor rolls back an uncommitted transaction
    - Commit() or Rollback() on a finished transaction is a logic error

  SQLite: BEGIN IMMEDIATE on the shared connection
  Memory: private snapshot, version checked on commit
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace aggregator::db
