#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace availability::util {

/*
  UUID helpers

  Audit, outbox and blackout rows are keyed by random RFC4122 v4 UUIDs.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

inline std::string GenerateUUIDString() {
  return ToString(GenerateUUID());
}

} // namespace availability::util
