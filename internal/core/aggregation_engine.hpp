#pragma once

#include <memory>
#include <string>

#include "batch_registry.hpp"
#include "internal/fhe/ciphertext.hpp"
#include "internal/util/uuid.hpp"
#include "submission_ledger.hpp"

namespace aggregator::core {

struct Aggregate {
  uint64_t              batch_id   = 0;
  uint64_t              data_count = 0;
  fhe::CiphertextHandle sum;
  std::string           commitment; // raw SHA-256
};

/*
  Homomorphic sum and tamper-evident commitment of one batch.

  commitment = SHA-256(label || instance_id || count || len||fp_0 || ... )

  The commitment is a pure function of the ordered ciphertext set at call
  time: it changes iff a value is appended. Stored handles are initialized on
  a local copy only; nothing is written back.
*/
class AggregationEngine {
 public:
  static constexpr char kCommitmentLabel[] = "batch-aggregator/commitment/v1";

  AggregationEngine(std::shared_ptr<BatchRegistry> registry, std::shared_ptr<SubmissionLedger> ledger, std::shared_ptr<fhe::CiphertextBackend> backend,
                    util::UUID instance_id);

  // Throws util::InvalidBatch when the batch is missing or empty.
  Aggregate Compute(db::Transaction& tx, uint64_t batch_id) const;

  std::string Commitment(db::Transaction& tx, uint64_t batch_id) const;

 private:
  std::shared_ptr<BatchRegistry>          registry_;
  std::shared_ptr<SubmissionLedger>       ledger_;
  std::shared_ptr<fhe::CiphertextBackend> backend_;
  util::UUID                              instance_id_;
};

} // namespace aggregator::core
