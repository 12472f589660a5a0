#pragma once

#include <atomic>
#include <memory>

#include "decryption_oracle.hpp"
#include "decryption_queue.hpp"

namespace aggregator::oracle {

/*
  In-process decryption oracle.

  Hands out fresh sequential request ids and parks each request on a queue;
  a DecryptionWorker (or a test) drains the queue and resumes later.
*/
class LocalDecryptionOracle final : public DecryptionOracle {
 public:
  explicit LocalDecryptionOracle(std::shared_ptr<DecryptionQueue> queue, RequestId first_request_id = 1);

  RequestId RequestDecryption(const fhe::CiphertextHandle& handle, ResumeFn resume) override;

 private:
  std::shared_ptr<DecryptionQueue> queue_;
  std::atomic<RequestId>           next_request_id_;
};

} // namespace aggregator::oracle
