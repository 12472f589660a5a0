#include "time.hpp"

#include <cctype>
#include <stdexcept>

namespace aggregator::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

Duration ParseDuration(const std::string& text) {
  if (text.empty()) {
    return Duration::zero();
  }

  std::size_t digits = 0;
  while (digits < text.size() && std::isdigit(static_cast<unsigned char>(text[digits]))) {
    ++digits;
  }
  if (digits == 0) {
    throw std::runtime_error("invalid duration '" + text + "': expected leading digits");
  }

  const std::string unit = text.substr(digits);

  int64_t unit_ms = 0;
  if (unit == "ms") {
    unit_ms = 1;
  } else if (unit == "s") {
    unit_ms = 1000;
  } else if (unit == "m") {
    unit_ms = 60 * 1000;
  } else if (unit == "h") {
    unit_ms = 60 * 60 * 1000;
  } else {
    throw std::runtime_error("invalid duration '" + text + "': unit must be one of ms, s, m, h");
  }

  uint64_t amount = 0;
  try {
    amount = std::stoull(text.substr(0, digits));
  } catch (const std::out_of_range&) {
    throw std::runtime_error("invalid duration '" + text + "': exceeds " + std::to_string(kMaxDuration.count()) + "ms");
  }
  if (amount > static_cast<uint64_t>(kMaxDuration.count() / unit_ms)) {
    throw std::runtime_error("invalid duration '" + text + "': exceeds " + std::to_string(kMaxDuration.count()) + "ms");
  }

  return Duration(static_cast<int64_t>(amount) * unit_ms);
}

} // namespace aggregator::util
