#pragma once

#include <memory>
#include <string>

#include "aggregation_engine.hpp"
#include "event_buffer.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/oracle/decryption_oracle.hpp"

namespace aggregator::core {

struct Finalization {
  uint64_t request_id = 0;
  uint64_t batch_id   = 0;
  uint64_t average    = 0;
};

/*
  Second half of the two-phase decryption protocol.

  Check order:
    known request -> not yet processed -> batch non-empty ->
    commitment unchanged -> attestation valid -> cleartext decodes

  average = sum / data_count, truncating.
*/
class CallbackVerifier {
 public:
  CallbackVerifier(std::shared_ptr<db::Repository> repository, std::shared_ptr<AggregationEngine> engine,
                   std::shared_ptr<const oracle::AttestationVerifier> verifier, util::NowFn now);

  Finalization OnDecryptionResult(db::Transaction& tx, uint64_t request_id, const std::string& cleartext, const std::string& attestation,
                                  EventBuffer& events);

 private:
  std::shared_ptr<db::Repository>                   repository_;
  std::shared_ptr<AggregationEngine>                engine_;
  std::shared_ptr<const oracle::AttestationVerifier> verifier_;
  util::NowFn                                       now_;
};

} // namespace aggregator::core
