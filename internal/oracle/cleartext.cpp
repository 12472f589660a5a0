#include "cleartext.hpp"

namespace aggregator::oracle {

std::string EncodeCleartext(uint64_t value) {
  std::string out(kCleartextSize, '\0');
  for (int i = static_cast<int>(kCleartextSize) - 1; i >= 0; --i) {
    out[i] = static_cast<char>(value & 0xFF);
    value >>= 8;
  }
  return out;
}

std::optional<uint64_t> DecodeCleartext(const std::string& cleartext) {
  if (cleartext.size() != kCleartextSize) {
    return std::nullopt;
  }

  uint64_t value = 0;
  for (const char ch : cleartext) {
    value = (value << 8) | static_cast<unsigned char>(ch);
  }
  return value;
}

} // namespace aggregator::oracle
