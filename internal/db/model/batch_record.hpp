#pragma once

#include <cstdint>

namespace aggregator::db::model {

/*
  Persistent batch row.

  - id is sequential from 1 and never reused
  - data_count only grows, and only while closed == false
  - closed is terminal
*/
struct BatchRecord {
  uint64_t id         = 0;
  uint64_t data_count = 0;
  bool     closed     = false;

  uint64_t opened_at_ms = 0;
  uint64_t closed_at_ms = 0; // 0 while open
};

} // namespace aggregator::db::model
