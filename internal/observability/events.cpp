#include "events.hpp"

#include "logging.hpp"

namespace aggregator::observability {

namespace {

void LogEvent(const aggregator::v1::Event& event) {
  const auto sequence = static_cast<int64_t>(event.sequence());

  switch (event.kind_case()) {
    case aggregator::v1::Event::kBatchOpened:
      AGGREGATOR_LOG_INFO("batch opened", {IntField("seq", sequence), IntField("batch_id", static_cast<int64_t>(event.batch_opened().batch_id()))});
      break;
    case aggregator::v1::Event::kBatchClosed:
      AGGREGATOR_LOG_INFO("batch closed", {IntField("seq", sequence), IntField("batch_id", static_cast<int64_t>(event.batch_closed().batch_id()))});
      break;
    case aggregator::v1::Event::kDataSubmitted: {
      const auto& e = event.data_submitted();
      AGGREGATOR_LOG_INFO("data submitted", {IntField("seq", sequence), StringField("submitter", e.submitter()),
                                             IntField("batch_id", static_cast<int64_t>(e.batch_id())), IntField("index", static_cast<int64_t>(e.index())),
                                             HexField("fingerprint", e.fingerprint())});
      break;
    }
    case aggregator::v1::Event::kDecryptionRequested: {
      const auto& e = event.decryption_requested();
      AGGREGATOR_LOG_INFO("decryption requested", {IntField("seq", sequence), IntField("request_id", static_cast<int64_t>(e.request_id())),
                                                   IntField("batch_id", static_cast<int64_t>(e.batch_id())), HexField("commitment", e.commitment())});
      break;
    }
    case aggregator::v1::Event::kDecryptionCompleted: {
      const auto& e = event.decryption_completed();
      AGGREGATOR_LOG_INFO("decryption completed", {IntField("seq", sequence), IntField("request_id", static_cast<int64_t>(e.request_id())),
                                                   IntField("batch_id", static_cast<int64_t>(e.batch_id())),
                                                   IntField("average", static_cast<int64_t>(e.average()))});
      break;
    }
    case aggregator::v1::Event::KIND_NOT_SET:
      AGGREGATOR_LOG_WARN("event without kind", {IntField("seq", sequence)});
      break;
  }
}

} // namespace

EventJournal::EventJournal(std::size_t capacity, util::NowFn now) : capacity_(capacity == 0 ? kDefaultCapacity : capacity), now_(std::move(now)) {
}

void EventJournal::Publish(aggregator::v1::Event event) {
  std::lock_guard lock(mutex_);

  event.set_sequence(next_sequence_++);
  *event.mutable_emitted_at() = util::ToProto(now_());

  LogEvent(event);

  events_.push_back(std::move(event));
  while (events_.size() > capacity_) {
    events_.pop_front();
  }
}

EventPage EventJournal::Read(uint64_t from_sequence, std::size_t max_events) const {
  std::lock_guard lock(mutex_);

  EventPage page;
  page.next_sequence = from_sequence;

  for (const auto& event : events_) {
    if (event.sequence() < from_sequence) continue;
    if (max_events != 0 && page.events.size() >= max_events) break;
    page.events.push_back(event);
    page.next_sequence = event.sequence() + 1;
  }

  if (page.next_sequence == 0) page.next_sequence = 1;
  return page;
}

uint64_t EventJournal::LastSequence() const {
  std::lock_guard lock(mutex_);
  return next_sequence_ - 1;
}

} // namespace aggregator::observability
