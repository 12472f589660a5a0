#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace aggregator::oracle {

// Aggregate sums travel as a fixed-width 8-byte big-endian unsigned word.
constexpr std::size_t kCleartextSize = 8;

std::string             EncodeCleartext(uint64_t value);
std::optional<uint64_t> DecodeCleartext(const std::string& cleartext);

} // namespace aggregator::oracle
