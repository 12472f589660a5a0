#include "decryption_worker.hpp"

#include "cleartext.hpp"
#include "internal/observability/logging.hpp"

namespace aggregator::oracle {

DecryptionWorker::DecryptionWorker(std::shared_ptr<DecryptionQueue> queue, std::shared_ptr<const Decryptor> decryptor,
                                   std::shared_ptr<const HmacAttestor> attestor, std::chrono::milliseconds delivery_delay)
    : queue_(std::move(queue)), decryptor_(std::move(decryptor)), attestor_(std::move(attestor)), delivery_delay_(delivery_delay) {
}

DecryptionWorker::~DecryptionWorker() {
  Stop();
}

void DecryptionWorker::Start() {
  running_ = true;
  thread_  = std::thread(&DecryptionWorker::Run, this);
}

void DecryptionWorker::Stop() {
  queue_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

DecryptionResult DecryptionWorker::Resolve(const DecryptionTask& task) const {
  DecryptionResult result;
  result.cleartext   = EncodeCleartext(decryptor_->Decrypt(task.handle));
  result.attestation = attestor_->Sign(task.request_id, result.cleartext);
  return result;
}

bool DecryptionWorker::Deliver(const DecryptionTask& task) const {
  try {
    const auto result = Resolve(task);
    task.resume(task.request_id, result.cleartext, result.attestation);
    return true;
  } catch (const std::exception& e) {
    // The request stays pending; there is no automatic retry.
    AGGREGATOR_LOG_WARN("decryption delivery rejected", {observability::IntField("request_id", static_cast<int64_t>(task.request_id)),
                                                        observability::StringField("error", e.what())});
    return false;
  }
}

void DecryptionWorker::Run() {
  while (running_) {
    auto task = queue_->Dequeue();
    if (!task) break;

    if (delivery_delay_.count() > 0 && queue_->WaitForShutdown(delivery_delay_)) {
      // Undelivered requests stay pending and show up in ListPendingRequests.
      AGGREGATOR_LOG_INFO("decryption worker stopping with undelivered requests",
                          {observability::IntField("request_id", static_cast<int64_t>(task->request_id)),
                           observability::IntField("queued", static_cast<int64_t>(queue_->Size()))});
      break;
    }
    Deliver(*task);
  }
}

} // namespace aggregator::oracle
