#pragma once

#include <cassert>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/access/access_control.hpp"
#include "internal/core/batch_aggregator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/fhe/plaintext_backend.hpp"
#include "internal/observability/events.hpp"
#include "internal/oracle/decryption_queue.hpp"
#include "internal/oracle/decryption_worker.hpp"
#include "internal/oracle/hmac_attestation.hpp"
#include "internal/oracle/local_oracle.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace aggregator::testing {

constexpr char kOwner[]         = "owner";
constexpr char kAttestationKey[] = "test-attestation-key";

class RecordingSink final : public observability::EventSink {
 public:
  void Publish(aggregator::v1::Event event) override {
    events.push_back(std::move(event));
  }

  std::vector<aggregator::v1::Event> events;
};

struct ManualClock {
  std::shared_ptr<util::TimePoint> now = std::make_shared<util::TimePoint>(util::FromUnixMillis(1'700'000'000'000));

  util::NowFn Fn() const {
    auto shared = now;
    return [shared] { return *shared; };
  }

  void Advance(util::Duration d) {
    *now += d;
  }
};

struct FixtureOptions {
  util::Duration submission_cooldown{0};
  util::Duration decryption_request_cooldown{0};
  util::UUID     instance_id = util::FromString("6a1c4f0e-2b7d-4c3a-9e58-0d9b1f2a7c64");
};

/*
  Fully wired BatchAggregator over the in-memory repository and the local
  oracle. The decryption worker is never started: tests pull tasks off the
  queue and deliver them explicitly.
*/
struct AggregatorFixture {
  explicit AggregatorFixture(FixtureOptions options = {}) {
    access::AccessPolicy policy;
    policy.owner                       = kOwner;
    policy.providers                   = {"alice", "bob", "carol"};
    policy.submission_cooldown         = options.submission_cooldown;
    policy.decryption_request_cooldown = options.decryption_request_cooldown;

    repository = std::make_shared<db::memory::MemoryRepository>();
    access     = std::make_shared<access::StaticAccessControl>(policy);
    backend    = std::make_shared<fhe::PlaintextCiphertextBackend>();
    queue      = std::make_shared<oracle::DecryptionQueue>();
    attestor   = std::make_shared<oracle::HmacAttestor>(kAttestationKey);
    sink       = std::make_shared<RecordingSink>();
    worker     = std::make_unique<oracle::DecryptionWorker>(queue, backend, attestor);

    core::BatchAggregatorDeps deps;
    deps.repository  = repository;
    deps.backend     = backend;
    deps.oracle      = std::make_shared<oracle::LocalDecryptionOracle>(queue);
    deps.verifier    = std::make_shared<oracle::HmacAttestationVerifier>(kAttestationKey);
    deps.access      = access;
    deps.events      = sink;
    deps.instance_id = options.instance_id;
    deps.now         = clock.Fn();

    aggregator = std::make_shared<core::BatchAggregator>(std::move(deps));
    aggregator->Initialize();
  }

  core::SubmissionReceipt Submit(const std::string& identity, uint64_t value) {
    return aggregator->Submit(identity, backend->Encrypt(value));
  }

  oracle::DecryptionTask NextTask() {
    auto task = queue->TryDequeue();
    assert(task.has_value());
    return std::move(*task);
  }

  core::Finalization Deliver(const oracle::DecryptionTask& task) {
    const auto result = worker->Resolve(task);
    return aggregator->OnDecryptionResult(task.request_id, result.cleartext, result.attestation);
  }

  std::size_t CountEvents(aggregator::v1::Event::KindCase kind) const {
    std::size_t count = 0;
    for (const auto& event : sink->events) {
      if (event.kind_case() == kind) ++count;
    }
    return count;
  }

  ManualClock                                      clock;
  std::shared_ptr<db::memory::MemoryRepository>    repository;
  std::shared_ptr<access::StaticAccessControl>     access;
  std::shared_ptr<fhe::PlaintextCiphertextBackend> backend;
  std::shared_ptr<oracle::DecryptionQueue>         queue;
  std::shared_ptr<oracle::HmacAttestor>            attestor;
  std::shared_ptr<RecordingSink>                   sink;
  std::unique_ptr<oracle::DecryptionWorker>        worker;
  std::shared_ptr<core::BatchAggregator>           aggregator;
};

// Runs fn and reports whether it threw E (or a subclass).
template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  } catch (const std::exception&) {
    return false;
  }
  return false;
}

} // namespace aggregator::testing
