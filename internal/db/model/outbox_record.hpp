#pragma once

#include <cstdint>
#include <string>

namespace availability::db::model {

// Durable outbox row; delivery is owned by an external relay.
struct OutboxRecord {
  std::string id;
  std::string event_type; // "availability.week_saved"
  std::string aggregate_id;
  std::string payload_json;
  uint64_t    created_at_ms = 0;
};

} // namespace availability::db::model
