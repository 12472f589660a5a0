#include "local_oracle.hpp"

#include <stdexcept>

namespace aggregator::oracle {

LocalDecryptionOracle::LocalDecryptionOracle(std::shared_ptr<DecryptionQueue> queue, RequestId first_request_id)
    : queue_(std::move(queue)), next_request_id_(first_request_id) {
  if (!queue_) {
    throw std::invalid_argument("local oracle requires a queue");
  }
}

RequestId LocalDecryptionOracle::RequestDecryption(const fhe::CiphertextHandle& handle, ResumeFn resume) {
  DecryptionTask task;
  task.request_id = next_request_id_.fetch_add(1);
  task.handle     = handle;
  task.resume     = std::move(resume);

  const auto request_id = task.request_id;
  queue_->Enqueue(std::move(task));
  return request_id;
}

} // namespace aggregator::oracle
