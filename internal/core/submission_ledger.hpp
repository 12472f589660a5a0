#pragma once

#include <memory>
#include <string>
#include <vector>

#include "batch_registry.hpp"
#include "cooldown_tracker.hpp"
#include "event_buffer.hpp"
#include "internal/access/access_control.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/fhe/ciphertext.hpp"
#include "internal/util/time.hpp"

namespace aggregator::core {

struct SubmissionReceipt {
  uint64_t    batch_id = 0;
  uint64_t    index    = 0;
  std::string fingerprint;
};

/*
  Append-only store of encrypted values, keyed by (batch_id, index).

  Precondition order on Submit():
    provider -> not paused -> cooldown -> open batch -> well-formed ciphertext
*/
class SubmissionLedger {
 public:
  SubmissionLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<BatchRegistry> registry, std::shared_ptr<fhe::CiphertextBackend> backend,
                   std::shared_ptr<const access::AccessControl> access, std::shared_ptr<CooldownTracker> cooldowns, util::NowFn now);

  SubmissionReceipt Submit(db::Transaction& tx, const std::string& submitter, const fhe::CiphertextHandle& value, EventBuffer& events);

  // Stored handles of a batch in index order.
  std::vector<fhe::CiphertextHandle> Values(db::Transaction& tx, uint64_t batch_id) const;

 private:
  std::shared_ptr<db::Repository>              repository_;
  std::shared_ptr<BatchRegistry>               registry_;
  std::shared_ptr<fhe::CiphertextBackend>      backend_;
  std::shared_ptr<const access::AccessControl> access_;
  std::shared_ptr<CooldownTracker>             cooldowns_;
  util::NowFn                                  now_;
};

} // namespace aggregator::core
