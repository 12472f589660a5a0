#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "decryption_queue.hpp"
#include "hmac_attestation.hpp"

namespace aggregator::oracle {

struct DecryptionResult {
  std::string cleartext;
  std::string attestation;
};

/*
  Background worker playing the oracle's off-chain role.

  Executes:
      decrypt sum → encode cleartext → attest → resume(request_id, ...)
*/
class DecryptionWorker {
 public:
  DecryptionWorker(std::shared_ptr<DecryptionQueue> queue, std::shared_ptr<const Decryptor> decryptor, std::shared_ptr<const HmacAttestor> attestor,
                   std::chrono::milliseconds delivery_delay = std::chrono::milliseconds::zero());
  ~DecryptionWorker();

  DecryptionWorker(const DecryptionWorker&)            = delete;
  DecryptionWorker& operator=(const DecryptionWorker&) = delete;

  void Start();
  void Stop();

  // Synchronous form of one worker step, without delivering.
  DecryptionResult Resolve(const DecryptionTask& task) const;

  // Resolve + deliver one task; returns false if the resume entry point rejected it.
  bool Deliver(const DecryptionTask& task) const;

 private:
  void Run();

  std::shared_ptr<DecryptionQueue>    queue_;
  std::shared_ptr<const Decryptor>    decryptor_;
  std::shared_ptr<const HmacAttestor> attestor_;
  std::chrono::milliseconds           delivery_delay_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace aggregator::oracle
