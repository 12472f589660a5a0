#pragma once

#include <string>
#include <string_view>

namespace aggregator::util {

// Lowercase hex of raw bytes.
std::string ToHex(std::string_view bytes);

// Inverse of ToHex; accepts an optional "0x" prefix. Throws std::runtime_error on bad input.
std::string FromHex(std::string_view hex);

} // namespace aggregator::util
