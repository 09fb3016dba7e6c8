#pragma once

#include <cstdint>
#include <string>

namespace availability::db::model {

/*
  Append-only audit row.

  Written in the same transaction as the change it describes; never
  updated afterwards. Snapshots are protobuf JSON of WindowSnapshot.
*/

struct AuditRecord {
  std::string id;
  std::string instructor_id;
  std::string actor_id;
  std::string action;      // "save_week", "copy_week", "add_blackout", ...
  std::string target_date; // week start or the single affected date
  std::string before_json;
  std::string after_json;
  uint64_t    created_at_ms = 0;
};

} // namespace availability::db::model
