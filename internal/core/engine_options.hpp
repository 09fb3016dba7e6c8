#pragma once

#include <chrono>

namespace availability::core {

enum class PastEditPolicy {
  kAllow,
  // Dates before instructor-local today are skipped.
  kForbid,
  // Dates more than past_edit_window_days before today are skipped.
  kWindow,
};

struct RetentionOptions {
  bool enabled          = false;
  int  retention_days   = 180;
  int  keep_recent_days = 30;
  bool dry_run          = false;
};

/*
  Everything the engine is allowed to know about deployment policy. Built
  once by the factory from RuntimeConfig.
*/
struct EngineOptions {
  PastEditPolicy       past_edit_policy      = PastEditPolicy::kAllow;
  int                  past_edit_window_days = 0;
  bool                 audit_enabled         = true;
  bool                 suppress_past_events  = false;
  std::chrono::seconds week_cache_ttl{300};
  std::chrono::seconds day_cache_ttl{300};
  RetentionOptions     retention;
};

} // namespace availability::core
