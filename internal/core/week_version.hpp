#pragma once

#include <string>

#include "internal/bitmap/bit_codec.hpp"

namespace availability::core {

/*
  Week version token.

  SHA-1 over the seven packed day vectors, Monday first, rendered as
  lowercase hex. A pure function of the bits: identical weeks always get
  identical tokens regardless of when or how they were written. Used only
  for optimistic concurrency, never shown to users.
*/
std::string ComputeWeekVersion(const bitmap::WeekBits& week);

} // namespace availability::core
