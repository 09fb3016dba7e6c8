#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/cache/memory_cache.hpp"
#include "internal/clock/local_date_resolver.hpp"
#include "internal/core/availability_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/store/day_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using availability::core::AvailabilityEngine;
using availability::core::DaySubmission;
using availability::core::EngineOptions;
using availability::core::PastEditPolicy;
using availability::core::RawWindow;
using availability::core::SaveWeekRequest;
using availability::util::Date;
using availability::util::ParseIsoDate;

const Date kWeekOne   = ParseIsoDate("2024-06-10");
const Date kWeekTwo   = ParseIsoDate("2024-06-17");
const Date kWeekThree = ParseIsoDate("2024-06-24");

struct Fixture {
  std::shared_ptr<availability::store::DayStore>          store;
  std::shared_ptr<availability::clock::FixedDateResolver> clock;
  std::unique_ptr<AvailabilityEngine>                     engine;
};

Fixture MakeFixture(EngineOptions options = {}, Date today = ParseIsoDate("2024-06-03")) {
  Fixture f;
  f.store  = std::make_shared<availability::store::DayStore>(std::make_shared<availability::db::memory::MemoryRepository>());
  f.clock  = std::make_shared<availability::clock::FixedDateResolver>(today);
  f.engine = std::make_unique<AvailabilityEngine>(
      f.store, availability::cache::SafeCache(std::make_shared<availability::cache::MemoryCache>()), f.clock, options);
  return f;
}

void Save(AvailabilityEngine& engine, Date week, std::vector<DaySubmission> days) {
  SaveWeekRequest request;
  request.instructor_id = "instructor-1";
  request.week_start    = week;
  request.days          = std::move(days);
  engine.SaveWeekBits(request);
}

std::vector<std::string> Windows(AvailabilityEngine& engine, Date date) {
  std::vector<std::string> out;
  if (auto windows = engine.GetAvailabilityForDate("instructor-1", date)) {
    for (const auto& window : *windows) {
      out.push_back(availability::bitmap::FormatWindow(window));
    }
  }
  return out;
}

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestCopyWeekReplacesTarget() {
  auto f = MakeFixture();
  Save(*f.engine, kWeekOne, {DaySubmission{kWeekOne, {RawWindow{"09:00:00", "10:00:00"}}}});
  Save(*f.engine, kWeekTwo, {DaySubmission{kWeekTwo + std::chrono::days{1}, {RawWindow{"15:00:00", "16:00:00"}}}});

  const auto result = f.engine->CopyWeek("instructor-1", kWeekOne, kWeekTwo, "admin-1");
  assert(result.weeks_written == 1);
  assert(result.days_written == 7);

  assert(Windows(*f.engine, kWeekTwo) == std::vector<std::string>{"09:00:00-10:00:00"});
  assert(Windows(*f.engine, kWeekTwo + std::chrono::days{1}).empty());

  const auto audit = f.store->ListAudit("instructor-1");
  assert(audit.back().action == "copy_week");
  assert(audit.back().actor_id == "admin-1");
}

void TestCopyWeekRejectsSameWeek() {
  auto f = MakeFixture();
  assert(Throws<availability::util::ValidationFailure>([&] { f.engine->CopyWeek("instructor-1", kWeekOne, kWeekOne, ""); }));
  assert(Throws<availability::util::ValidationFailure>(
      [&] { f.engine->CopyWeek("instructor-1", kWeekOne, kWeekTwo + std::chrono::days{2}, ""); }));
}

void TestApplyPatternCoversRangeByWeekday() {
  auto f = MakeFixture();
  Save(*f.engine, kWeekOne, {DaySubmission{kWeekOne, {RawWindow{"09:00:00", "10:00:00"}}},
                             DaySubmission{kWeekOne + std::chrono::days{2}, {RawWindow{"13:00:00", "14:00:00"}}}});
  // Tuesday of week three has availability the pattern does not have.
  Save(*f.engine, kWeekThree, {DaySubmission{kWeekThree + std::chrono::days{1}, {RawWindow{"08:00:00", "09:00:00"}}}});

  // Wednesday of week two through Tuesday of week three.
  const auto result =
      f.engine->ApplyPatternToRange("instructor-1", kWeekOne, kWeekTwo + std::chrono::days{2}, kWeekThree + std::chrono::days{1}, "");
  assert(result.weeks_written == 2);
  assert(result.days_written == 7);

  assert(Windows(*f.engine, kWeekTwo).empty());
  assert(Windows(*f.engine, kWeekTwo + std::chrono::days{2}) == std::vector<std::string>{"13:00:00-14:00:00"});
  assert(Windows(*f.engine, kWeekThree) == std::vector<std::string>{"09:00:00-10:00:00"});
  assert(Windows(*f.engine, kWeekThree + std::chrono::days{1}).empty());
}

void TestApplyPatternSkipsGuardedDates() {
  EngineOptions options;
  options.past_edit_policy = PastEditPolicy::kForbid;
  auto f                   = MakeFixture(options, ParseIsoDate("2024-06-19"));
  Save(*f.engine, kWeekThree, {DaySubmission{kWeekThree, {RawWindow{"09:00:00", "10:00:00"}}}});

  const auto result = f.engine->ApplyPatternToRange("instructor-1", kWeekThree, kWeekTwo, kWeekTwo + std::chrono::days{6}, "");
  assert(result.skipped.past_forbidden == 2);
  assert(result.days_written == 5);
  assert(Windows(*f.engine, kWeekTwo).empty());
}

void TestSpecificDateMergesIntoItsWeek() {
  auto       f      = MakeFixture();
  const auto friday = kWeekOne + std::chrono::days{4};
  f.engine->AddSpecificDateAvailability("instructor-1", friday, RawWindow{"10:00:00", "11:00:00"}, "");
  const auto result = f.engine->AddSpecificDateAvailability("instructor-1", friday, RawWindow{"12:00:00", "24:00:00"}, "");

  assert(result.rows_written == 1);
  assert((Windows(*f.engine, friday) == std::vector<std::string>{"10:00:00-11:00:00", "12:00:00-24:00:00"}));
  assert(f.store->ListAudit("instructor-1").back().action == "add_specific_date");

  assert(Throws<availability::util::OverlapConflict>(
      [&] { f.engine->AddSpecificDateAvailability("instructor-1", friday, RawWindow{"10:30:00", "11:30:00"}, ""); }));
}

void TestSummaryAndRangeListOnlyAvailableDays() {
  auto f = MakeFixture();
  Save(*f.engine, kWeekOne,
       {DaySubmission{kWeekOne, {RawWindow{"09:00:00", "10:00:00"}, RawWindow{"11:00:00", "12:00:00"}}},
        DaySubmission{kWeekOne + std::chrono::days{3}, {RawWindow{"09:00:00", "10:00:00"}}}});
  Save(*f.engine, kWeekTwo, {DaySubmission{kWeekTwo, {RawWindow{"09:00:00", "10:00:00"}}}});

  const auto summary = f.engine->GetAvailabilitySummary("instructor-1", kWeekOne, kWeekOne + std::chrono::days{6});
  assert(summary.size() == 2);
  assert(summary.at(kWeekOne) == 2);
  assert(summary.at(kWeekOne + std::chrono::days{3}) == 1);

  const auto range = f.engine->GetAvailabilityForRange("instructor-1", kWeekOne + std::chrono::days{1}, kWeekTwo);
  assert(range.size() == 2);
  assert(range[0].date == kWeekOne + std::chrono::days{3});
  assert(range[1].date == kWeekTwo);

  assert(Throws<availability::util::ValidationFailure>(
      [&] { f.engine->GetAvailabilitySummary("instructor-1", kWeekTwo, kWeekOne); }));
  assert(Throws<availability::util::ValidationFailure>(
      [&] { f.engine->GetAvailabilityForRange("instructor-1", kWeekOne, kWeekOne + std::chrono::days{400}); }));
}

void TestBlackoutLifecycle() {
  auto f = MakeFixture();

  const auto added = f.engine->AddBlackoutDate("instructor-1", kWeekOne, "conference");
  assert(added.has_value());
  assert(added->day_date == "2024-06-10");
  assert(!added->id.empty());

  assert(Throws<availability::util::AlreadyExists>([&] { f.engine->AddBlackoutDate("instructor-1", kWeekOne, "again"); }));

  const auto listed = f.engine->ListBlackoutDates("instructor-1");
  assert(listed.size() == 1);
  assert(listed[0].reason == "conference");

  const auto audit = f.store->ListAudit("instructor-1");
  assert(audit.size() == 1);
  assert(audit[0].action == "add_blackout");
  assert(audit[0].before_json == "{}");

  f.engine->DeleteBlackoutDate("instructor-1", added->id);
  assert(f.engine->ListBlackoutDates("instructor-1").empty());

  assert(Throws<availability::util::NotFound>([&] { f.engine->DeleteBlackoutDate("instructor-1", added->id); }));
  assert(Throws<availability::util::ValidationFailure>([&] { f.engine->DeleteBlackoutDate("instructor-1", ""); }));
}

void TestBlackoutListStartsAtToday() {
  auto f = MakeFixture({}, ParseIsoDate("2024-06-12"));
  f.engine->AddBlackoutDate("instructor-1", kWeekOne, "past");
  f.engine->AddBlackoutDate("instructor-1", kWeekTwo, "future");

  const auto listed = f.engine->ListBlackoutDates("instructor-1");
  assert(listed.size() == 1);
  assert(listed[0].day_date == "2024-06-17");
}

void TestGuardedBlackoutIsSkipped() {
  EngineOptions options;
  options.past_edit_policy = PastEditPolicy::kForbid;
  auto f                   = MakeFixture(options, kWeekTwo);

  assert(!f.engine->AddBlackoutDate("instructor-1", kWeekOne, "too late").has_value());
  assert(f.engine->AddBlackoutDate("instructor-1", kWeekTwo, "today").has_value());
}

void TestRetentionPurge() {
  EngineOptions options;
  options.retention.enabled          = true;
  options.retention.retention_days   = 10;
  options.retention.keep_recent_days = 20;
  options.retention.dry_run          = true;
  auto f                             = MakeFixture(options, ParseIsoDate("2024-07-10"));

  Save(*f.engine, kWeekOne, {DaySubmission{kWeekOne, {RawWindow{"09:00:00", "10:00:00"}}},
                             DaySubmission{kWeekOne + std::chrono::days{1}, {RawWindow{"09:00:00", "10:00:00"}}}});
  Save(*f.engine, kWeekThree, {DaySubmission{kWeekThree, {RawWindow{"09:00:00", "10:00:00"}}}});

  // keep_recent_days wins: cutoff is 20 days back.
  const auto preview = f.engine->PurgeRetention(std::nullopt);
  assert(preview.dry_run);
  assert(preview.cutoff == ParseIsoDate("2024-06-20"));
  assert(preview.rows_purged == 2);
  assert(Windows(*f.engine, kWeekOne).size() == 1);

  const auto purged = f.engine->PurgeRetention(false);
  assert(!purged.dry_run);
  assert(purged.rows_purged == 2);
  assert(f.store->GetRange("instructor-1", kWeekOne, kWeekOne + std::chrono::days{6}).empty());
  assert(f.store->GetRange("instructor-1", kWeekThree, kWeekThree).size() == 1);
}

void TestRetentionDisabled() {
  auto f = MakeFixture();
  assert(Throws<availability::util::ValidationFailure>([&] { f.engine->PurgeRetention(true); }));
}

} // namespace

int main() {
  TestCopyWeekReplacesTarget();
  TestCopyWeekRejectsSameWeek();
  TestApplyPatternCoversRangeByWeekday();
  TestApplyPatternSkipsGuardedDates();
  TestSpecificDateMergesIntoItsWeek();
  TestSummaryAndRangeListOnlyAvailableDays();
  TestBlackoutLifecycle();
  TestBlackoutListStartsAtToday();
  TestGuardedBlackoutIsSkipped();
  TestRetentionPurge();
  TestRetentionDisabled();

  std::cout << "availability_unit_week_operations: pass\n";
  return 0;
}
