#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

#include "decryption_oracle.hpp"

namespace aggregator::oracle {

struct DecryptionTask {
  RequestId             request_id = 0;
  fhe::CiphertextHandle handle;
  ResumeFn              resume;
};

/*
  Thread-safe blocking queue between the local oracle and its worker.
*/
class DecryptionQueue {
 public:
  void Enqueue(DecryptionTask task);

  // blocking wait; nullopt once shut down and drained
  std::optional<DecryptionTask> Dequeue();

  // non-blocking
  std::optional<DecryptionTask> TryDequeue();

  std::size_t Size() const;

  // Sleeps up to timeout; returns true as soon as Shutdown() has been called.
  bool WaitForShutdown(std::chrono::milliseconds timeout);

  void Shutdown();

 private:
  mutable std::mutex         mutex_;
  std::condition_variable    cv_;
  std::deque<DecryptionTask> queue_;
  bool                       shutdown_ = false;
};

} // namespace aggregator::oracle
