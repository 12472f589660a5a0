#include "batch_registry.hpp"

#include <stdexcept>

#include "internal/model/batch_state.hpp"
#include "internal/util/errors.hpp"

namespace aggregator::core {

using model::BatchState;

BatchRegistry::BatchRegistry(std::shared_ptr<db::Repository> repository, std::shared_ptr<const access::AccessControl> access, util::NowFn now)
    : repository_(std::move(repository)), access_(std::move(access)), now_(std::move(now)) {
}

void BatchRegistry::EnsureInitialized(db::Transaction& tx, EventBuffer& events) {
  if (repository_->GetCurrentBatchId(tx).has_value()) return;
  OpenBatch(tx, events);
}

db::model::BatchRecord BatchRegistry::OpenBatch(db::Transaction& tx, EventBuffer& events) {
  const auto current = repository_->GetCurrentBatchId(tx);

  db::model::BatchRecord batch;
  batch.id           = current ? *current + 1 : 1;
  batch.opened_at_ms = util::ToUnixMillis(now_());

  db::ThrowIfError(repository_->InsertBatch(tx, batch), "open batch " + std::to_string(batch.id));
  EmitBatchOpened(events, batch.id);
  return batch;
}

BatchTransition BatchRegistry::CloseBatch(db::Transaction& tx, const std::string& caller, EventBuffer& events) {
  if (!access_->IsAdmin(caller)) {
    throw util::Unauthorized("close batch: '" + caller + "' is not the administrator");
  }

  const auto current_id = repository_->GetCurrentBatchId(tx);
  if (!current_id) {
    throw util::InvalidBatch("close batch: no batch has been opened");
  }

  auto batch = repository_->GetBatch(tx, *current_id);
  if (!batch || batch->id != *current_id) {
    throw util::InvalidBatch("close batch: current batch " + std::to_string(*current_id) + " not found");
  }
  if (!model::CanTransition(model::StateOf(batch->closed), BatchState::kClosed)) {
    throw util::InvalidBatch("close batch: batch " + std::to_string(batch->id) + " already closed");
  }

  batch->closed       = true;
  batch->closed_at_ms = util::ToUnixMillis(now_());
  db::ThrowIfError(repository_->UpdateBatch(tx, *batch), "close batch " + std::to_string(batch->id));
  EmitBatchClosed(events, batch->id);

  BatchTransition transition;
  transition.closed = *batch;
  transition.opened = OpenBatch(tx, events);
  return transition;
}

std::optional<db::model::BatchRecord> BatchRegistry::Current(db::Transaction& tx) const {
  const auto current_id = repository_->GetCurrentBatchId(tx);
  if (!current_id) return std::nullopt;
  return repository_->GetBatch(tx, *current_id);
}

std::optional<db::model::BatchRecord> BatchRegistry::Get(db::Transaction& tx, uint64_t batch_id) const {
  return repository_->GetBatch(tx, batch_id);
}

uint64_t BatchRegistry::RecordSubmission(db::Transaction& tx, db::model::BatchRecord& batch) {
  if (model::IsTerminal(model::StateOf(batch.closed))) {
    throw util::BatchClosedOrInvalid("batch " + std::to_string(batch.id) + " is closed");
  }

  const uint64_t index = batch.data_count;
  batch.data_count++;
  db::ThrowIfError(repository_->UpdateBatch(tx, batch), "update batch " + std::to_string(batch.id));
  return index;
}

} // namespace aggregator::core
