#pragma once

#include <cstdint>
#include <string>

namespace aggregator::db::model {

/*
  Pending or completed decryption request, keyed by the oracle's request id.

  Created once by the coordinator. processed flips false -> true exactly once,
  together with average and completed_at_ms.
*/
struct DecryptionContextRecord {
  uint64_t    request_id = 0;
  uint64_t    batch_id   = 0;
  std::string state_hash; // commitment at request time, raw 32 bytes
  bool        processed = false;

  std::string requester;
  uint64_t    data_count      = 0;
  uint64_t    requested_at_ms = 0;

  uint64_t average         = 0;
  uint64_t completed_at_ms = 0;
};

} // namespace aggregator::db::model
