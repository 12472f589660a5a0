#include "memory_tx.hpp"

#include <stdexcept>
#include <string>

namespace aggregator::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_      = repo_.committed_;
  base_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (phase_ == Phase::kActive) Rollback();
}

void MemoryTransaction::RequireActive(const char* operation) const {
  if (phase_ != Phase::kActive) {
    throw std::logic_error(std::string("memory transaction: ") + operation + " after the transaction finished");
  }
}

void MemoryTransaction::Commit() {
  RequireActive("commit");

  if (dirty_) {
    std::scoped_lock lock(repo_.mutex_);
    if (repo_.committed_version_ != base_version_) {
      throw std::runtime_error("memory transaction: conflict, snapshot version " + std::to_string(base_version_) + " but store is at " +
                               std::to_string(repo_.committed_version_));
    }
    repo_.committed_ = std::move(working_);
    repo_.committed_version_++;
  }

  phase_ = Phase::kCommitted;
}

void MemoryTransaction::Rollback() {
  RequireActive("rollback");
  working_ = {};
  phase_   = Phase::kRolledBack;
}

} // namespace aggregator::db::memory
