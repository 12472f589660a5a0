#include "aggregation_engine.hpp"

#include <stdexcept>

#include "internal/crypto/digest.hpp"
#include "internal/util/errors.hpp"

namespace aggregator::core {

AggregationEngine::AggregationEngine(std::shared_ptr<BatchRegistry> registry, std::shared_ptr<SubmissionLedger> ledger,
                                     std::shared_ptr<fhe::CiphertextBackend> backend, util::UUID instance_id)
    : registry_(std::move(registry)), ledger_(std::move(ledger)), backend_(std::move(backend)), instance_id_(instance_id) {
}

Aggregate AggregationEngine::Compute(db::Transaction& tx, uint64_t batch_id) const {
  const auto batch = registry_->Get(tx, batch_id);
  if (!batch) {
    throw util::InvalidBatch("batch " + std::to_string(batch_id) + " does not exist");
  }
  if (batch->data_count == 0) {
    throw util::InvalidBatch("batch " + std::to_string(batch_id) + " is empty");
  }

  auto values = ledger_->Values(tx, batch_id);
  if (values.size() != batch->data_count) {
    throw std::runtime_error("batch " + std::to_string(batch_id) + ": stored values (" + std::to_string(values.size()) + ") disagree with data_count (" +
                             std::to_string(batch->data_count) + ")");
  }

  crypto::Sha256Builder commitment;
  commitment.Update(kCommitmentLabel);
  commitment.Update(std::string_view(reinterpret_cast<const char*>(instance_id_.data()), instance_id_.size()));
  commitment.UpdateU64(values.size());

  Aggregate aggregate;
  aggregate.batch_id   = batch_id;
  aggregate.data_count = batch->data_count;
  backend_->InitializeIfNeeded(aggregate.sum);

  for (auto& value : values) {
    backend_->InitializeIfNeeded(value);
    aggregate.sum = backend_->Add(aggregate.sum, value);
    commitment.UpdateField(backend_->Fingerprint(value));
  }

  aggregate.commitment = commitment.Finish();
  return aggregate;
}

std::string AggregationEngine::Commitment(db::Transaction& tx, uint64_t batch_id) const {
  return Compute(tx, batch_id).commitment;
}

} // namespace aggregator::core
