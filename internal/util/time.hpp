#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace aggregator::util {

/*
  Time utilities. Single place to control clock source.

  Core components never call Clock::now() directly; they receive a NowFn so
  tests can drive cooldown windows deterministically.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration  = std::chrono::milliseconds;
using NowFn     = std::function<TimePoint()>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// Upper bound for configured intervals; keeps deadlines representable on the
// steady and system clocks.
inline constexpr Duration kMaxDuration = std::chrono::hours(24 * 365 * 100);

// Parses "250ms", "10s", "5m", "1h". Empty string parses as zero. Values above
// kMaxDuration are rejected.
Duration ParseDuration(const std::string& text);

} // namespace aggregator::util
