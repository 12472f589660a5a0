#include <cassert>
#include <chrono>
#include <iostream>

#include "aggregator_fixture.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;

using aggregator::fhe::CiphertextHandle;
using aggregator::testing::AggregatorFixture;
using aggregator::testing::FixtureOptions;
using aggregator::testing::kOwner;
using aggregator::testing::Throws;
using aggregator::v1::Event;

void TestIndicesFollowSubmissionOrder() {
  AggregatorFixture fx;

  for (uint64_t k = 1; k <= 5; ++k) {
    const auto receipt = fx.Submit(k % 2 ? "alice" : "bob", k * 10);
    assert(receipt.batch_id == 1);
    assert(receipt.index == k - 1);
    assert(receipt.fingerprint.size() == 32);
  }
  assert(fx.aggregator->CurrentBatch().data_count == 5);

  auto tx     = fx.repository->Begin();
  auto stored = fx.repository->ListCiphertexts(*tx, 1);
  assert(stored.size() == 5);
  for (uint64_t i = 0; i < stored.size(); ++i) {
    assert(stored[i].index == i);
  }
  assert(stored[0].submitter == "alice");
  assert(stored[1].submitter == "bob");
}

void TestSubmissionEmitsEvent() {
  AggregatorFixture fx;
  fx.sink->events.clear();

  const auto receipt = fx.Submit("carol", 42);

  assert(fx.sink->events.size() == 1);
  const auto& event = fx.sink->events[0];
  assert(event.kind_case() == Event::kDataSubmitted);
  assert(event.data_submitted().submitter() == "carol");
  assert(event.data_submitted().batch_id() == 1);
  assert(event.data_submitted().index() == 0);
  assert(event.data_submitted().fingerprint() == receipt.fingerprint);
}

void TestNonProviderRejected() {
  AggregatorFixture fx;
  assert(Throws<aggregator::util::NotProvider>([&] { fx.Submit("mallory", 1); }));
  assert(Throws<aggregator::util::NotProvider>([&] { fx.Submit(kOwner, 1); }));
  assert(fx.aggregator->CurrentBatch().data_count == 0);
}

void TestProviderCheckPrecedesPause() {
  AggregatorFixture fx;
  fx.access->SetPaused(true);

  assert(Throws<aggregator::util::NotProvider>([&] { fx.Submit("mallory", 1); }));
  assert(Throws<aggregator::util::Paused>([&] { fx.Submit("alice", 1); }));

  fx.access->SetPaused(false);
  assert(fx.Submit("alice", 1).index == 0);
}

void TestSubmissionCooldown() {
  FixtureOptions options;
  options.submission_cooldown = 10s;
  AggregatorFixture fx(options);

  fx.Submit("alice", 1);
  assert(Throws<aggregator::util::CooldownActive>([&] { fx.Submit("alice", 2); }));

  // Other identities are unaffected.
  fx.Submit("bob", 3);

  fx.clock.Advance(9999ms);
  assert(Throws<aggregator::util::CooldownActive>([&] { fx.Submit("alice", 2); }));

  fx.clock.Advance(1ms);
  assert(fx.Submit("alice", 2).index == 2);
}

void TestPauseCheckPrecedesCooldown() {
  FixtureOptions options;
  options.submission_cooldown = 1h;
  AggregatorFixture fx(options);

  fx.Submit("alice", 1);
  fx.access->SetPaused(true);
  assert(Throws<aggregator::util::Paused>([&] { fx.Submit("alice", 2); }));
}

void TestFailedSubmissionDoesNotStartCooldown() {
  FixtureOptions options;
  options.submission_cooldown = 1h;
  AggregatorFixture fx(options);

  CiphertextHandle garbage{"not-an-envelope"};
  assert(Throws<aggregator::util::InvalidCiphertext>([&] { fx.aggregator->Submit("alice", garbage); }));

  // The rejected attempt left no cooldown behind.
  assert(fx.Submit("alice", 5).index == 0);
}

void TestCooldownNamespacesAreIndependent() {
  FixtureOptions options;
  options.submission_cooldown         = 1h;
  options.decryption_request_cooldown = 1h;
  AggregatorFixture fx(options);

  fx.Submit("alice", 5);
  fx.aggregator->RequestAggregateDecryption("bob", 1);

  // bob's request cooldown does not block his submissions, and vice versa.
  fx.Submit("bob", 6);
  fx.aggregator->RequestAggregateDecryption("alice", 1);
}

void TestMalformedCiphertextRejected() {
  AggregatorFixture fx;
  fx.sink->events.clear();

  auto truncated = fx.backend->Encrypt(9);
  truncated.bytes.pop_back();

  assert(Throws<aggregator::util::InvalidCiphertext>([&] { fx.aggregator->Submit("alice", truncated); }));
  assert(fx.aggregator->CurrentBatch().data_count == 0);
  assert(fx.sink->events.empty());
}

void TestUninitializedHandleCountsAsZero() {
  AggregatorFixture fx;

  const auto receipt = fx.aggregator->Submit("alice", CiphertextHandle{});
  assert(receipt.index == 0);
  assert(receipt.fingerprint == fx.backend->Fingerprint(fx.backend->Zero()));

  fx.Submit("bob", 8);
  fx.aggregator->RequestAggregateDecryption("carol", 1);
  const auto result = fx.Deliver(fx.NextTask());
  assert(result.average == 4);
}

void TestSubmissionToClosedBatchImpossible() {
  AggregatorFixture fx;
  fx.Submit("alice", 1);
  fx.aggregator->CloseBatch(kOwner);

  // Submissions always land in the open batch; batch 1 is frozen.
  fx.Submit("alice", 2);
  assert(fx.aggregator->GetBatch(1)->data_count == 1);
  assert(fx.aggregator->GetBatch(2)->data_count == 1);
}

} // namespace

int main() {
  TestIndicesFollowSubmissionOrder();
  TestSubmissionEmitsEvent();
  TestNonProviderRejected();
  TestProviderCheckPrecedesPause();
  TestSubmissionCooldown();
  TestPauseCheckPrecedesCooldown();
  TestFailedSubmissionDoesNotStartCooldown();
  TestCooldownNamespacesAreIndependent();
  TestMalformedCiphertextRejected();
  TestUninitializedHandleCountsAsZero();
  TestSubmissionToClosedBatchImpossible();

  std::cout << "aggregator_unit_submission_ledger: pass\n";
  return 0;
}
