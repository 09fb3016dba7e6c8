#include "internal/factory.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

#include "internal/config/config_loader.hpp"
#include "internal/core/availability_engine.hpp"

namespace {

using availability::config::ConfigLoader;
using availability::core::PastEditPolicy;
using availability::factory::BuildEngineOptions;

void TestDefaultsAllowPastEdits() {
  const auto options = BuildEngineOptions(ConfigLoader::LoadFromString(""));
  assert(options.past_edit_policy == PastEditPolicy::kAllow);
  assert(!options.audit_enabled);
  assert(options.week_cache_ttl == std::chrono::seconds{300});
  assert(options.day_cache_ttl == std::chrono::seconds{300});
  assert(!options.retention.enabled);
  assert(options.retention.retention_days == 180);
  assert(options.retention.keep_recent_days == 30);
}

void TestForbidWinsOverWindow() {
  const auto options = BuildEngineOptions(ConfigLoader::LoadFromString(R"(availability:
  forbid_past_edits: true
  past_edit_window_days: 3
)"));
  assert(options.past_edit_policy == PastEditPolicy::kForbid);
}

void TestWindowPolicyAndOverrides() {
  const auto options = BuildEngineOptions(ConfigLoader::LoadFromString(R"(cache:
  week_ttl_seconds: 60
availability:
  slot_minutes: 30
  past_edit_window_days: 3
  audit_enabled: true
  suppress_past_events: true
  retention:
    enabled: true
    retention_days: 10
    dry_run: true
)"));
  assert(options.past_edit_policy == PastEditPolicy::kWindow);
  assert(options.past_edit_window_days == 3);
  assert(options.audit_enabled);
  assert(options.suppress_past_events);
  assert(options.week_cache_ttl == std::chrono::seconds{60});
  assert(options.day_cache_ttl == std::chrono::seconds{300});
  assert(options.retention.enabled);
  assert(options.retention.dry_run);
  assert(options.retention.retention_days == 10);
  assert(options.retention.keep_recent_days == 30);
}

void TestUnsupportedSlotSizeIsRejected() {
  bool threw = false;
  try {
    (void)BuildEngineOptions(ConfigLoader::LoadFromString("availability:\n  slot_minutes: 15\n"));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestBadInstructorOffsetIsRejected() {
  bool threw = false;
  try {
    (void)availability::factory::Build(ConfigLoader::LoadFromString(R"(availability:
  instructor_utc_offset_minutes:
    instructor-1: 1000
)"));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestBuildMemoryApplication() {
  auto app = availability::factory::Build(ConfigLoader::LoadFromString(R"(database:
  memory: {}
cache:
  enabled: true
)"));

  assert(app.repository);
  assert(app.engine);
  assert(app.admission);
  assert(app.grpc_services.size() == 2);

  const auto week = app.engine->GetWeekAvailability("instructor-1", availability::util::ParseIsoDate("2024-06-10"));
  assert(week.days.size() == 7);
}

} // namespace

int main() {
  TestDefaultsAllowPastEdits();
  TestForbidWinsOverWindow();
  TestWindowPolicyAndOverrides();
  TestUnsupportedSlotSizeIsRejected();
  TestBadInstructorOffsetIsRejected();
  TestBuildMemoryApplication();

  std::cout << "availability_unit_factory: pass\n";
  return 0;
}
