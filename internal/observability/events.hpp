#pragma once

#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

#include "aggregator/v1/events.pb.h"
#include "internal/util/time.hpp"

namespace aggregator::observability {

// Receives events of committed operations, in commit order.
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void Publish(aggregator::v1::Event event) = 0;
};

struct EventPage {
  std::vector<aggregator::v1::Event> events;
  uint64_t                           next_sequence = 0;
};

/*
  Bounded in-memory event journal.

  Assigns sequence numbers starting at 1 and stamps emitted_at. Once full the
  oldest event is dropped; readers asking for a dropped sequence get the
  oldest retained ones. Every event is also logged.
*/
class EventJournal final : public EventSink {
 public:
  static constexpr std::size_t kDefaultCapacity = 1024;

  explicit EventJournal(std::size_t capacity = kDefaultCapacity, util::NowFn now = util::Now);

  void Publish(aggregator::v1::Event event) override;

  // max_events == 0 means everything retained from from_sequence on.
  EventPage Read(uint64_t from_sequence, std::size_t max_events) const;

  uint64_t LastSequence() const;

 private:
  mutable std::mutex                mutex_;
  std::deque<aggregator::v1::Event> events_;
  std::size_t                       capacity_;
  uint64_t                          next_sequence_ = 1;
  util::NowFn                       now_;
};

} // namespace aggregator::observability
