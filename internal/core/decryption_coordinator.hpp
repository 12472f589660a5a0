#pragma once

#include <memory>
#include <string>

#include "aggregation_engine.hpp"
#include "cooldown_tracker.hpp"
#include "event_buffer.hpp"
#include "internal/access/access_control.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/oracle/decryption_oracle.hpp"

namespace aggregator::core {

struct DecryptionTicket {
  uint64_t    request_id = 0;
  uint64_t    batch_id   = 0;
  std::string commitment;
};

/*
  First half of the two-phase decryption protocol.

  Computes the batch aggregate, hands the encrypted sum to the oracle and
  records a pending context under the oracle's request id. Never waits for
  the result; any number of requests per batch may be outstanding.
*/
class DecryptionCoordinator {
 public:
  DecryptionCoordinator(std::shared_ptr<db::Repository> repository, std::shared_ptr<AggregationEngine> engine,
                        std::shared_ptr<oracle::DecryptionOracle> oracle, std::shared_ptr<const access::AccessControl> access,
                        std::shared_ptr<CooldownTracker> cooldowns, util::NowFn now);

  DecryptionTicket RequestAggregateDecryption(db::Transaction& tx, uint64_t batch_id, const std::string& requester, oracle::ResumeFn resume,
                                              EventBuffer& events);

 private:
  std::shared_ptr<db::Repository>              repository_;
  std::shared_ptr<AggregationEngine>           engine_;
  std::shared_ptr<oracle::DecryptionOracle>    oracle_;
  std::shared_ptr<const access::AccessControl> access_;
  std::shared_ptr<CooldownTracker>             cooldowns_;
  util::NowFn                                  now_;
};

} // namespace aggregator::core
