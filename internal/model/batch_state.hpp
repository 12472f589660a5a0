#pragma once

#include <cstdint>

namespace aggregator::model {

enum class BatchState : std::uint8_t {
  kOpen   = 0,
  kClosed = 1,
};

constexpr bool IsTerminal(BatchState state) {
  return state == BatchState::kClosed;
}

constexpr bool CanTransition(BatchState from, BatchState to) {
  return from == BatchState::kOpen && to == BatchState::kClosed;
}

constexpr BatchState StateOf(bool closed) {
  return closed ? BatchState::kClosed : BatchState::kOpen;
}

} // namespace aggregator::model
