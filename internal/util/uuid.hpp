#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace aggregator::util {

/*
  UUID helpers

  The deployment instance identity is a raw 16 byte RFC4122 UUID. It is mixed
  into every batch commitment so state hashes from one deployment never
  validate against another.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

} // namespace aggregator::util
