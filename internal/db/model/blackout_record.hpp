#pragma once

#include <cstdint>
#include <string>

namespace availability::db::model {

// Unique per (instructor_id, day_date).
struct BlackoutRecord {
  std::string id;
  std::string instructor_id;
  std::string day_date;
  std::string reason;
  uint64_t    created_at_ms = 0;
};

} // namespace availability::db::model
