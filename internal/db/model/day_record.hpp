#pragma once

#include <cstdint>
#include <string>

namespace availability::db::model {

/*
  Persistent day row.

  One row per (instructor_id, day_date). Absence of a row means the
  instructor is unavailable all day.
*/

struct DayRecord {
  std::string instructor_id;

  // ISO date (YYYY-MM-DD); sorts lexicographically in calendar order.
  std::string day_date;

  // Packed 6-byte slot vector, see internal/bitmap/bit_codec.hpp.
  std::string bits;

  uint64_t updated_at_ms = 0;
};

} // namespace availability::db::model
