#include <cassert>
#include <iostream>

#include "aggregator_fixture.hpp"
#include "internal/util/errors.hpp"

namespace {

using aggregator::testing::AggregatorFixture;
using aggregator::testing::kOwner;
using aggregator::testing::Throws;
using aggregator::v1::Event;

void TestInitializeOpensFirstBatchOnce() {
  AggregatorFixture fx;

  const auto current = fx.aggregator->CurrentBatch();
  assert(current.id == 1);
  assert(current.data_count == 0);
  assert(!current.closed);

  fx.aggregator->Initialize();
  assert(fx.aggregator->CurrentBatch().id == 1);
  assert(fx.CountEvents(Event::kBatchOpened) == 1);
}

void TestCloseRequiresAdministrator() {
  AggregatorFixture fx;
  fx.sink->events.clear();

  assert(Throws<aggregator::util::Unauthorized>([&] { fx.aggregator->CloseBatch("alice"); }));
  assert(fx.aggregator->CurrentBatch().id == 1);
  assert(!fx.aggregator->CurrentBatch().closed);
  assert(fx.sink->events.empty());
}

void TestCloseOpensNextBatchImmediately() {
  AggregatorFixture fx;
  fx.Submit("alice", 7);
  fx.sink->events.clear();

  const auto transition = fx.aggregator->CloseBatch(kOwner);
  assert(transition.closed.id == 1);
  assert(transition.closed.closed);
  assert(transition.closed.data_count == 1);
  assert(transition.opened.id == 2);
  assert(!transition.opened.closed);
  assert(transition.opened.data_count == 0);

  assert(fx.sink->events.size() == 2);
  assert(fx.sink->events[0].kind_case() == Event::kBatchClosed);
  assert(fx.sink->events[0].batch_closed().batch_id() == 1);
  assert(fx.sink->events[1].kind_case() == Event::kBatchOpened);
  assert(fx.sink->events[1].batch_opened().batch_id() == 2);

  const auto old_batch = fx.aggregator->GetBatch(1);
  assert(old_batch.has_value());
  assert(old_batch->closed);
  assert(old_batch->closed_at_ms != 0);
  assert(fx.aggregator->CurrentBatch().id == 2);
}

void TestBatchIdsAreSequential() {
  AggregatorFixture fx;
  for (int i = 0; i < 4; ++i) {
    fx.aggregator->CloseBatch(kOwner);
  }

  assert(fx.aggregator->CurrentBatch().id == 5);
  for (uint64_t id = 1; id <= 4; ++id) {
    assert(fx.aggregator->GetBatch(id)->closed);
  }
  assert(!fx.aggregator->GetBatch(5)->closed);
  assert(!fx.aggregator->GetBatch(6).has_value());
}

void TestSubmissionsFollowTheOpenBatch() {
  AggregatorFixture fx;
  fx.Submit("alice", 1);
  fx.aggregator->CloseBatch(kOwner);

  const auto receipt = fx.Submit("bob", 2);
  assert(receipt.batch_id == 2);
  assert(receipt.index == 0);
  assert(fx.aggregator->GetBatch(1)->data_count == 1);
}

void TestClosedCurrentBatchRejectsClose() {
  AggregatorFixture fx;

  // Corrupt the store so the newest batch is closed with no successor.
  {
    auto tx    = fx.repository->Begin();
    auto batch = fx.repository->GetBatch(*tx, 1);
    batch->closed = true;
    assert(fx.repository->UpdateBatch(*tx, *batch));
    tx->Commit();
  }

  assert(Throws<aggregator::util::InvalidBatch>([&] { fx.aggregator->CloseBatch(kOwner); }));
  assert(Throws<aggregator::util::BatchClosedOrInvalid>([&] { fx.Submit("alice", 1); }));
}

} // namespace

int main() {
  TestInitializeOpensFirstBatchOnce();
  TestCloseRequiresAdministrator();
  TestCloseOpensNextBatchImmediately();
  TestBatchIdsAreSequential();
  TestSubmissionsFollowTheOpenBatch();
  TestClosedCurrentBatchRejectsClose();

  std::cout << "aggregator_unit_batch_registry: pass\n";
  return 0;
}
