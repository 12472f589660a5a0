#pragma once

#include <memory>
#include <optional>
#include <string>

#include "event_buffer.hpp"
#include "internal/access/access_control.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace aggregator::core {

struct BatchTransition {
  db::model::BatchRecord closed;
  db::model::BatchRecord opened;
};

/*
  Owns batch identity and lifecycle.

  Invariant: the batch with the highest id is the only open one. Batch ids
  are sequential from 1 and never reused; closing is terminal.
*/
class BatchRegistry {
 public:
  BatchRegistry(std::shared_ptr<db::Repository> repository, std::shared_ptr<const access::AccessControl> access, util::NowFn now);

  // Opens batch 1 on an empty store; no-op otherwise.
  void EnsureInitialized(db::Transaction& tx, EventBuffer& events);

  db::model::BatchRecord OpenBatch(db::Transaction& tx, EventBuffer& events);

  // Closes the current batch and opens the next one.
  BatchTransition CloseBatch(db::Transaction& tx, const std::string& caller, EventBuffer& events);

  std::optional<db::model::BatchRecord> Current(db::Transaction& tx) const;
  std::optional<db::model::BatchRecord> Get(db::Transaction& tx, uint64_t batch_id) const;

  // Bumps data_count of an open batch; returns the index the new value occupies.
  uint64_t RecordSubmission(db::Transaction& tx, db::model::BatchRecord& batch);

 private:
  std::shared_ptr<db::Repository>              repository_;
  std::shared_ptr<const access::AccessControl> access_;
  util::NowFn                                  now_;
};

} // namespace aggregator::core
