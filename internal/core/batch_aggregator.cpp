#include "batch_aggregator.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace aggregator::core {

BatchAggregator::BatchAggregator(BatchAggregatorDeps deps) : repository_(std::move(deps.repository)), events_(std::move(deps.events)) {
  if (!repository_ || !deps.backend || !deps.oracle || !deps.verifier || !deps.access) {
    throw std::invalid_argument("batch aggregator: missing dependency");
  }

  cooldowns_   = std::make_shared<CooldownTracker>(repository_, deps.now);
  registry_    = std::make_shared<BatchRegistry>(repository_, deps.access, deps.now);
  ledger_      = std::make_shared<SubmissionLedger>(repository_, registry_, deps.backend, deps.access, cooldowns_, deps.now);
  engine_      = std::make_shared<AggregationEngine>(registry_, ledger_, deps.backend, deps.instance_id);
  coordinator_ = std::make_shared<DecryptionCoordinator>(repository_, engine_, deps.oracle, deps.access, cooldowns_, deps.now);
  verifier_    = std::make_shared<CallbackVerifier>(repository_, engine_, deps.verifier, deps.now);
}

template <typename Fn>
auto BatchAggregator::Execute(Fn&& fn) {
  std::lock_guard lock(mutex_);

  auto        tx = repository_->Begin();
  EventBuffer events;
  auto        result = fn(*tx, events);
  tx->Commit();

  if (events_) {
    for (auto& event : events) {
      events_->Publish(std::move(event));
    }
  }
  return result;
}

oracle::ResumeFn BatchAggregator::MakeResume() {
  std::weak_ptr<BatchAggregator> self = weak_from_this();
  return [self](oracle::RequestId request_id, const std::string& cleartext, const std::string& attestation) {
    auto aggregator = self.lock();
    if (!aggregator) {
      throw std::runtime_error("decryption result " + std::to_string(request_id) + ": aggregator no longer available");
    }
    aggregator->OnDecryptionResult(request_id, cleartext, attestation);
  };
}

void BatchAggregator::Initialize() {
  Execute([&](db::Transaction& tx, EventBuffer& events) {
    registry_->EnsureInitialized(tx, events);
    return true;
  });
}

SubmissionReceipt BatchAggregator::Submit(const std::string& submitter, const fhe::CiphertextHandle& value) {
  return Execute([&](db::Transaction& tx, EventBuffer& events) { return ledger_->Submit(tx, submitter, value, events); });
}

BatchTransition BatchAggregator::CloseBatch(const std::string& caller) {
  return Execute([&](db::Transaction& tx, EventBuffer& events) { return registry_->CloseBatch(tx, caller, events); });
}

DecryptionTicket BatchAggregator::RequestAggregateDecryption(const std::string& requester, uint64_t batch_id) {
  auto resume = MakeResume();
  return Execute([&](db::Transaction& tx, EventBuffer& events) {
    return coordinator_->RequestAggregateDecryption(tx, batch_id, requester, std::move(resume), events);
  });
}

Finalization BatchAggregator::OnDecryptionResult(uint64_t request_id, const std::string& cleartext, const std::string& attestation) {
  return Execute([&](db::Transaction& tx, EventBuffer& events) { return verifier_->OnDecryptionResult(tx, request_id, cleartext, attestation, events); });
}

db::model::BatchRecord BatchAggregator::CurrentBatch() {
  return Execute([&](db::Transaction& tx, EventBuffer&) {
    auto batch = registry_->Current(tx);
    if (!batch) throw util::NotFound("no batch has been opened");
    return *batch;
  });
}

std::optional<db::model::BatchRecord> BatchAggregator::GetBatch(uint64_t batch_id) {
  return Execute([&](db::Transaction& tx, EventBuffer&) { return registry_->Get(tx, batch_id); });
}

std::optional<db::model::DecryptionContextRecord> BatchAggregator::GetDecryptionRequest(uint64_t request_id) {
  return Execute([&](db::Transaction& tx, EventBuffer&) { return repository_->GetDecryptionContext(tx, request_id); });
}

std::vector<db::model::DecryptionContextRecord> BatchAggregator::ListPendingRequests(uint64_t limit) {
  return Execute([&](db::Transaction& tx, EventBuffer&) { return repository_->ListDecryptionContexts(tx, true, limit); });
}

std::string BatchAggregator::Commitment(uint64_t batch_id) {
  return Execute([&](db::Transaction& tx, EventBuffer&) { return engine_->Commitment(tx, batch_id); });
}

AggregatorStats BatchAggregator::Stats() {
  return Execute([&](db::Transaction& tx, EventBuffer&) {
    AggregatorStats stats;

    const auto current = registry_->Current(tx);
    if (current && !current->closed) stats.open_batch_id = current->id;

    stats.batches     = current ? current->id : 0;
    stats.submissions = repository_->CountCiphertexts(tx);

    for (const auto& context : repository_->ListDecryptionContexts(tx, false, 0)) {
      if (context.processed) {
        stats.completed_requests++;
      } else {
        stats.pending_requests++;
      }
    }
    return stats;
  });
}

} // namespace aggregator::core
