#include <cassert>
#include <iostream>
#include <memory>

#include "internal/access/access_control.hpp"
#include "internal/core/aggregation_engine.hpp"
#include "internal/core/batch_registry.hpp"
#include "internal/core/cooldown_tracker.hpp"
#include "internal/core/submission_ledger.hpp"
#include "internal/crypto/digest.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/fhe/plaintext_backend.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using namespace aggregator;

struct EngineHarness {
  explicit EngineHarness(util::UUID instance_id = util::FromString("00112233-4455-6677-8899-aabbccddeeff")) {
    access::AccessPolicy policy;
    policy.owner     = "owner";
    policy.providers = {"alice"};

    repository = std::make_shared<db::memory::MemoryRepository>();
    backend    = std::make_shared<fhe::PlaintextCiphertextBackend>();
    auto acl   = std::make_shared<access::StaticAccessControl>(policy);
    auto now   = util::NowFn(util::Now);

    registry = std::make_shared<core::BatchRegistry>(repository, acl, now);
    ledger   = std::make_shared<core::SubmissionLedger>(repository, registry, backend, acl, std::make_shared<core::CooldownTracker>(repository, now), now);
    engine   = std::make_shared<core::AggregationEngine>(registry, ledger, backend, instance_id);

    auto tx = repository->Begin();
    registry->EnsureInitialized(*tx, events);
    tx->Commit();
  }

  void Submit(const fhe::CiphertextHandle& value) {
    auto tx = repository->Begin();
    ledger->Submit(*tx, "alice", value, events);
    tx->Commit();
  }

  core::Aggregate Compute(uint64_t batch_id) {
    auto tx = repository->Begin();
    return engine->Compute(*tx, batch_id);
  }

  std::shared_ptr<db::memory::MemoryRepository>    repository;
  std::shared_ptr<fhe::PlaintextCiphertextBackend> backend;
  std::shared_ptr<core::BatchRegistry>             registry;
  std::shared_ptr<core::SubmissionLedger>          ledger;
  std::shared_ptr<core::AggregationEngine>         engine;
  core::EventBuffer                                events;
};

void TestSumIsHomomorphicTotal() {
  EngineHarness h;
  h.Submit(h.backend->Encrypt(10));
  h.Submit(h.backend->Encrypt(20));
  h.Submit(h.backend->Encrypt(30));

  const auto aggregate = h.Compute(1);
  assert(aggregate.batch_id == 1);
  assert(aggregate.data_count == 3);
  assert(h.backend->Decrypt(aggregate.sum) == 60);
  assert(aggregate.commitment.size() == crypto::kSha256Size);
}

void TestSumWrapsModulo64Bits() {
  EngineHarness h;
  h.Submit(h.backend->Encrypt(UINT64_MAX));
  h.Submit(h.backend->Encrypt(2));

  assert(h.backend->Decrypt(h.Compute(1).sum) == 1);
}

void TestCommitmentIsDeterministic() {
  EngineHarness h;
  h.Submit(h.backend->Encrypt(5));
  h.Submit(h.backend->Encrypt(6));

  const auto first  = h.Compute(1).commitment;
  const auto second = h.Compute(1).commitment;
  assert(first == second);
}

void TestCommitmentChangesOnAppend() {
  EngineHarness h;
  h.Submit(h.backend->Encrypt(5));
  const auto before = h.Compute(1).commitment;

  h.Submit(h.backend->Encrypt(0));
  const auto after = h.Compute(1).commitment;
  assert(before != after);
}

void TestCommitmentMatchesDocumentedLayout() {
  const auto instance = util::FromString("00112233-4455-6677-8899-aabbccddeeff");
  EngineHarness h(instance);

  const auto value = h.backend->Encrypt(77);
  h.Submit(value);

  crypto::Sha256Builder expected;
  expected.Update(core::AggregationEngine::kCommitmentLabel);
  expected.Update(std::string_view(reinterpret_cast<const char*>(instance.data()), instance.size()));
  expected.UpdateU64(1);
  expected.UpdateField(h.backend->Fingerprint(value));

  assert(h.Compute(1).commitment == expected.Finish());
}

void TestCommitmentBoundToInstance() {
  EngineHarness a(util::FromString("00000000-0000-4000-8000-000000000001"));
  EngineHarness b(util::FromString("00000000-0000-4000-8000-000000000002"));

  const auto value = a.backend->Encrypt(3);
  a.Submit(value);
  b.Submit(value);

  assert(a.Compute(1).commitment != b.Compute(1).commitment);
}

void TestEmptyOrMissingBatchIsInvalid() {
  EngineHarness h;

  bool threw = false;
  try {
    h.Compute(1);
  } catch (const util::InvalidBatch&) {
    threw = true;
  }
  assert(threw && "empty batch must not aggregate");

  threw = false;
  try {
    h.Compute(99);
  } catch (const util::InvalidBatch&) {
    threw = true;
  }
  assert(threw && "missing batch must not aggregate");
}

void TestComputeDoesNotWriteBack() {
  EngineHarness h;
  h.Submit(fhe::CiphertextHandle{});
  h.Compute(1);

  auto tx     = h.repository->Begin();
  auto stored = h.repository->ListCiphertexts(*tx, 1);
  assert(stored.size() == 1);
  assert(stored[0].handle.empty());
}

} // namespace

int main() {
  TestSumIsHomomorphicTotal();
  TestSumWrapsModulo64Bits();
  TestCommitmentIsDeterministic();
  TestCommitmentChangesOnAppend();
  TestCommitmentMatchesDocumentedLayout();
  TestCommitmentBoundToInstance();
  TestEmptyOrMissingBatchIsInvalid();
  TestComputeDoesNotWriteBack();

  std::cout << "aggregator_unit_aggregation_engine: pass\n";
  return 0;
}
