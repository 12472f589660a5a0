#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "aggregation_engine.hpp"
#include "batch_registry.hpp"
#include "callback_verifier.hpp"
#include "cooldown_tracker.hpp"
#include "decryption_coordinator.hpp"
#include "internal/access/access_control.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/fhe/ciphertext.hpp"
#include "internal/observability/events.hpp"
#include "internal/oracle/decryption_oracle.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "submission_ledger.hpp"

namespace aggregator::core {

struct BatchAggregatorDeps {
  std::shared_ptr<db::Repository>                    repository;
  std::shared_ptr<fhe::CiphertextBackend>            backend;
  std::shared_ptr<oracle::DecryptionOracle>          oracle;
  std::shared_ptr<const oracle::AttestationVerifier> verifier;
  std::shared_ptr<const access::AccessControl>       access;
  std::shared_ptr<observability::EventSink>          events; // optional

  util::UUID  instance_id{};
  util::NowFn now = util::Now;
};

struct AggregatorStats {
  uint64_t open_batch_id      = 0;
  uint64_t batches            = 0;
  uint64_t submissions        = 0;
  uint64_t pending_requests   = 0;
  uint64_t completed_requests = 0;
};

/*
  BatchAggregator

  Owns the application state and is the single entry point for every
  operation, including the oracle's resume callback.

  Every state-changing operation:
    - runs under one mutex (one global order)
    - runs in one repository transaction
    - publishes its events only after commit

  A failed operation therefore leaves no trace. Must be owned by a
  std::shared_ptr: resume callbacks hold a weak reference.
*/
class BatchAggregator : public std::enable_shared_from_this<BatchAggregator> {
 public:
  explicit BatchAggregator(BatchAggregatorDeps deps);

  // Opens batch 1 on a fresh store.
  void Initialize();

  SubmissionReceipt Submit(const std::string& submitter, const fhe::CiphertextHandle& value);

  BatchTransition CloseBatch(const std::string& caller);

  DecryptionTicket RequestAggregateDecryption(const std::string& requester, uint64_t batch_id);

  // Resume entry point for the decryption oracle.
  Finalization OnDecryptionResult(uint64_t request_id, const std::string& cleartext, const std::string& attestation);

  db::model::BatchRecord                        CurrentBatch();
  std::optional<db::model::BatchRecord>         GetBatch(uint64_t batch_id);
  std::optional<db::model::DecryptionContextRecord> GetDecryptionRequest(uint64_t request_id);
  std::vector<db::model::DecryptionContextRecord>   ListPendingRequests(uint64_t limit);
  std::string                                   Commitment(uint64_t batch_id);
  AggregatorStats                               Stats();

 private:
  template <typename Fn>
  auto Execute(Fn&& fn);

  oracle::ResumeFn MakeResume();

  std::shared_ptr<db::Repository>           repository_;
  std::shared_ptr<observability::EventSink> events_;

  std::shared_ptr<CooldownTracker>       cooldowns_;
  std::shared_ptr<BatchRegistry>         registry_;
  std::shared_ptr<SubmissionLedger>      ledger_;
  std::shared_ptr<AggregationEngine>     engine_;
  std::shared_ptr<DecryptionCoordinator> coordinator_;
  std::shared_ptr<CallbackVerifier>      verifier_;

  std::mutex mutex_;
};

} // namespace aggregator::core
