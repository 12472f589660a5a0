#pragma once

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace aggregator::db::memory {

/*
  Snapshot transaction over MemoryRepository.

  Reads and writes go to a private copy of the committed state. A transaction
  that wrote anything fails to commit once another writer committed after its
  snapshot; read-only transactions always commit.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return phase_ == Phase::kCommitted;
  }

  MemoryRepository::State& Mutable() {
    dirty_ = true;
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  enum class Phase { kActive, kCommitted, kRolledBack };

  void RequireActive(const char* operation) const;

  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                base_version_ = 0;
  bool                    dirty_        = false;
  Phase                   phase_        = Phase::kActive;
};

} // namespace aggregator::db::memory
