#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/fhe/plaintext_backend.hpp"
#include "internal/oracle/cleartext.hpp"
#include "internal/oracle/decryption_queue.hpp"
#include "internal/oracle/decryption_worker.hpp"
#include "internal/oracle/hmac_attestation.hpp"
#include "internal/oracle/local_oracle.hpp"

namespace {

using namespace aggregator;

void TestCleartextEncoding() {
  const auto encoded = oracle::EncodeCleartext(0x0102030405060708ULL);
  assert(encoded.size() == oracle::kCleartextSize);
  assert(encoded == std::string("\x01\x02\x03\x04\x05\x06\x07\x08", 8));
  assert(oracle::DecodeCleartext(encoded) == 0x0102030405060708ULL);

  assert(oracle::DecodeCleartext(oracle::EncodeCleartext(UINT64_MAX)) == UINT64_MAX);
  assert(!oracle::DecodeCleartext("").has_value());
  assert(!oracle::DecodeCleartext(std::string(9, '\0')).has_value());
}

void TestAttestationBindsRequestAndValue() {
  oracle::HmacAttestor            attestor("shared-key");
  oracle::HmacAttestationVerifier verifier("shared-key");

  const auto value = oracle::EncodeCleartext(60);
  const auto tag   = attestor.Sign(5, value);
  assert(verifier.Verify(5, value, tag));

  assert(!verifier.Verify(6, value, tag));
  assert(!verifier.Verify(5, oracle::EncodeCleartext(61), tag));
  assert(!verifier.Verify(5, value, tag.substr(1)));
  assert(!verifier.Verify(5, value, ""));

  oracle::HmacAttestationVerifier other("other-key");
  assert(!other.Verify(5, value, tag));
}

void TestEmptyAttestationKeyRejected() {
  bool threw = false;
  try {
    oracle::HmacAttestor attestor("");
    attestor.Sign(1, oracle::EncodeCleartext(1));
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);
}

void TestQueueOrderingAndShutdown() {
  oracle::DecryptionQueue queue;
  assert(!queue.TryDequeue().has_value());

  for (oracle::RequestId id = 1; id <= 3; ++id) {
    oracle::DecryptionTask task;
    task.request_id = id;
    queue.Enqueue(std::move(task));
  }
  assert(queue.Size() == 3);
  assert(queue.TryDequeue()->request_id == 1);
  assert(queue.Dequeue()->request_id == 2);

  queue.Shutdown();
  // Drains what is left, then reports closed.
  assert(queue.Dequeue()->request_id == 3);
  assert(!queue.Dequeue().has_value());
}

void TestQueueWakesBlockedConsumer() {
  oracle::DecryptionQueue queue;
  std::atomic<bool>       woke{false};

  std::thread consumer([&] {
    auto task = queue.Dequeue();
    assert(!task.has_value());
    woke = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  assert(!woke);
  queue.Shutdown();
  consumer.join();
  assert(woke);
}

void TestWaitForShutdownReturnsEarly() {
  oracle::DecryptionQueue queue;
  assert(!queue.WaitForShutdown(std::chrono::milliseconds(10)));

  std::thread stopper([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.Shutdown();
  });

  const auto started = std::chrono::steady_clock::now();
  assert(queue.WaitForShutdown(std::chrono::hours(1)));
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
  stopper.join();

  // stays signalled
  assert(queue.WaitForShutdown(std::chrono::milliseconds(0)));
}

void TestLocalOracleIssuesSequentialIds() {
  auto                          queue = std::make_shared<oracle::DecryptionQueue>();
  oracle::LocalDecryptionOracle oracle(queue, 41);
  fhe::PlaintextCiphertextBackend backend;

  assert(oracle.RequestDecryption(backend.Encrypt(1), {}) == 41);
  assert(oracle.RequestDecryption(backend.Encrypt(2), {}) == 42);
  assert(queue->Size() == 2);

  auto task = queue->TryDequeue();
  assert(task->request_id == 41);
  assert(backend.Decrypt(task->handle) == 1);
}

struct Delivered {
  oracle::RequestId request_id = 0;
  std::string       cleartext;
  std::string       attestation;
};

void TestWorkerResolvesAndResumes() {
  auto backend  = std::make_shared<fhe::PlaintextCiphertextBackend>();
  auto queue    = std::make_shared<oracle::DecryptionQueue>();
  auto attestor = std::make_shared<oracle::HmacAttestor>("worker-key");

  oracle::LocalDecryptionOracle oracle(queue);
  oracle::DecryptionWorker      worker(queue, backend, attestor);

  std::mutex             mutex;
  std::vector<Delivered> delivered;
  auto                   resume = [&](oracle::RequestId id, const std::string& cleartext, const std::string& attestation) {
    std::lock_guard lock(mutex);
    delivered.push_back({id, cleartext, attestation});
  };

  worker.Start();
  oracle.RequestDecryption(backend->Encrypt(90), resume);
  oracle.RequestDecryption(backend->Encrypt(7), resume);

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (std::chrono::steady_clock::now() < deadline) {
    {
      std::lock_guard lock(mutex);
      if (delivered.size() == 2) break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  worker.Stop();

  assert(delivered.size() == 2);
  oracle::HmacAttestationVerifier verifier("worker-key");
  assert(delivered[0].request_id == 1);
  assert(oracle::DecodeCleartext(delivered[0].cleartext) == 90);
  assert(verifier.Verify(1, delivered[0].cleartext, delivered[0].attestation));
  assert(oracle::DecodeCleartext(delivered[1].cleartext) == 7);
}

void TestWorkerReportsRejectedDelivery() {
  auto backend  = std::make_shared<fhe::PlaintextCiphertextBackend>();
  auto queue    = std::make_shared<oracle::DecryptionQueue>();
  auto attestor = std::make_shared<oracle::HmacAttestor>("worker-key");

  oracle::DecryptionWorker worker(queue, backend, attestor);

  oracle::DecryptionTask task;
  task.request_id = 3;
  task.handle     = backend->Encrypt(12);
  task.resume     = [](oracle::RequestId, const std::string&, const std::string&) { throw std::runtime_error("rejected"); };
  assert(!worker.Deliver(task));

  task.resume = [](oracle::RequestId, const std::string&, const std::string&) {};
  assert(worker.Deliver(task));
}

} // namespace

int main() {
  TestCleartextEncoding();
  TestAttestationBindsRequestAndValue();
  TestEmptyAttestationKeyRejected();
  TestQueueOrderingAndShutdown();
  TestQueueWakesBlockedConsumer();
  TestWaitForShutdownReturnsEarly();
  TestLocalOracleIssuesSequentialIds();
  TestWorkerResolvesAndResumes();
  TestWorkerReportsRejectedDelivery();

  std::cout << "aggregator_unit_oracle: pass\n";
  return 0;
}
