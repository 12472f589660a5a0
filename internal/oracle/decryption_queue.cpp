#include "decryption_queue.hpp"

namespace aggregator::oracle {

void DecryptionQueue::Enqueue(DecryptionTask task) {
  {
    std::lock_guard lock(mutex_);
    queue_.push_back(std::move(task));
  }
  cv_.notify_all();
}

std::optional<DecryptionTask> DecryptionQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  DecryptionTask task = std::move(queue_.front());
  queue_.pop_front();
  return task;
}

std::optional<DecryptionTask> DecryptionQueue::TryDequeue() {
  std::lock_guard lock(mutex_);
  if (queue_.empty()) return std::nullopt;

  DecryptionTask task = std::move(queue_.front());
  queue_.pop_front();
  return task;
}

std::size_t DecryptionQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

bool DecryptionQueue::WaitForShutdown(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  return cv_.wait_for(lock, timeout, [&] { return shutdown_; });
}

void DecryptionQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace aggregator::oracle
