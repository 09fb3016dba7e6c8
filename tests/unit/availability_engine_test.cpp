#include "internal/core/availability_engine.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/cache/memory_cache.hpp"
#include "internal/clock/local_date_resolver.hpp"
#include "internal/core/booking_admission.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/store/day_store.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/hooked_repository.hpp"

namespace {

using availability::core::AvailabilityEngine;
using availability::core::DaySubmission;
using availability::core::EngineOptions;
using availability::core::PastEditPolicy;
using availability::core::RawWindow;
using availability::core::SaveWeekRequest;
using availability::util::Date;
using availability::util::ParseIsoDate;

const Date kMonday   = ParseIsoDate("2024-06-10");
const Date kTuesday  = ParseIsoDate("2024-06-11");
const Date kSaturday = ParseIsoDate("2024-06-15");

struct Fixture {
  std::shared_ptr<availability::store::DayStore>            store;
  std::shared_ptr<availability::clock::FixedDateResolver>   clock;
  std::shared_ptr<AvailabilityEngine>                       engine;
  std::shared_ptr<availability::core::BookingAdmission>     admission;
};

Fixture MakeFixture(EngineOptions options = {}, Date today = ParseIsoDate("2024-06-03")) {
  Fixture f;
  f.store  = std::make_shared<availability::store::DayStore>(std::make_shared<availability::db::memory::MemoryRepository>());
  f.clock  = std::make_shared<availability::clock::FixedDateResolver>(today);
  f.engine = std::make_shared<AvailabilityEngine>(
      f.store, availability::cache::SafeCache(std::make_shared<availability::cache::MemoryCache>()), f.clock, options);
  f.admission = std::make_shared<availability::core::BookingAdmission>(f.engine);
  return f;
}

SaveWeekRequest Request(std::vector<DaySubmission> days) {
  SaveWeekRequest request;
  request.instructor_id = "instructor-1";
  request.week_start    = kMonday;
  request.days          = std::move(days);
  return request;
}

std::vector<std::string> DayWindows(AvailabilityEngine& engine, Date date) {
  std::vector<std::string> out;
  const auto               week = engine.GetWeekAvailability("instructor-1", availability::util::MondayOf(date), false);
  for (const auto& window : week.days[static_cast<std::size_t>(availability::util::WeekdayIndex(date))].windows) {
    out.push_back(availability::bitmap::FormatWindow(window));
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

void TestScenarioSingleWindowSaveAndAdmission() {
  auto f = MakeFixture();

  auto request           = Request({DaySubmission{kMonday, {RawWindow{"09:00:00", "12:00:00"}}}});
  request.clear_existing = true;
  const auto result      = f.engine->SaveWeekBits(request);

  assert(result.days_written == 1);
  assert(DayWindows(*f.engine, kMonday) == std::vector<std::string>{"09:00:00-12:00:00"});

  const auto inside = f.admission->Check("instructor-1", kMonday, "09:30:00", "10:00:00");
  assert(inside.available);
  assert(inside.reason == availability::core::AdmissionReason::kAvailable);

  const auto outside = f.admission->Check("instructor-1", kMonday, "13:00:00", "13:30:00");
  assert(!outside.available);
  assert(outside.reason == availability::core::AdmissionReason::kSlotUnavailable);
}

void TestScenarioIdenticalResaveKeepsVersion() {
  auto f = MakeFixture();

  auto request           = Request({DaySubmission{kMonday, {RawWindow{"09:00:00", "12:00:00"}}}});
  request.clear_existing = true;
  const auto first       = f.engine->SaveWeekBits(request);
  const auto second      = f.engine->SaveWeekBits(request);

  assert(second.days_written == 1);
  assert(second.rows_written == 0);
  assert(second.version == first.version);

  // A no-op write enqueues nothing.
  assert(f.store->ListOutbox().size() == 1);
}

void TestMergeKeepsUnrelatedWindows() {
  auto f = MakeFixture();
  f.engine->SaveWeekBits(Request({DaySubmission{kMonday, {RawWindow{"09:00:00", "10:00:00"}}}}));
  f.engine->SaveWeekBits(Request({DaySubmission{kMonday, {RawWindow{"14:00:00", "15:00:00"}}}}));

  assert((DayWindows(*f.engine, kMonday) == std::vector<std::string>{"09:00:00-10:00:00", "14:00:00-15:00:00"}));
}

void TestReplaceRebuildsWeekFromSubmission() {
  auto f = MakeFixture();
  f.engine->SaveWeekBits(Request({DaySubmission{kMonday, {RawWindow{"09:00:00", "10:00:00"}}},
                                  DaySubmission{kTuesday, {RawWindow{"08:00:00", "09:00:00"}}}}));

  // Overlapping the persisted window is fine when the day is rebuilt.
  auto request           = Request({DaySubmission{kMonday, {RawWindow{"09:30:00", "11:00:00"}}}});
  request.clear_existing = true;
  const auto result      = f.engine->SaveWeekBits(request);

  assert(DayWindows(*f.engine, kMonday) == std::vector<std::string>{"09:30:00-11:00:00"});
  assert(DayWindows(*f.engine, kTuesday).empty());
  assert(result.days_written == 1);
  assert(result.rows_written == 2);
}

void TestDayScopedClearLeavesOtherDays() {
  auto f = MakeFixture();
  f.engine->SaveWeekBits(Request({DaySubmission{kMonday, {RawWindow{"09:00:00", "10:00:00"}}},
                                  DaySubmission{kTuesday, {RawWindow{"08:00:00", "09:00:00"}}}}));

  auto request = Request({DaySubmission{kMonday, {RawWindow{"16:00:00", "17:00:00"}}}});
  request.clear_dates.insert(kMonday);
  f.engine->SaveWeekBits(request);

  assert(DayWindows(*f.engine, kMonday) == std::vector<std::string>{"16:00:00-17:00:00"});
  assert(DayWindows(*f.engine, kTuesday) == std::vector<std::string>{"08:00:00-09:00:00"});
}

void TestListedEmptyDayClearsAndAbsentDayIsUnchanged() {
  auto f = MakeFixture();
  f.engine->SaveWeekBits(Request({DaySubmission{kMonday, {RawWindow{"09:00:00", "10:00:00"}}},
                                  DaySubmission{kTuesday, {RawWindow{"08:00:00", "09:00:00"}}}}));

  const auto result = f.engine->SaveWeekBits(Request({DaySubmission{kTuesday, {}}}));
  assert(result.rows_written == 1);
  assert(DayWindows(*f.engine, kMonday) == std::vector<std::string>{"09:00:00-10:00:00"});
  assert(DayWindows(*f.engine, kTuesday).empty());
}

void TestSiblingOverlapIsRejectedInEitherOrder() {
  auto f = MakeFixture();

  bool caught = false;
  try {
    f.engine->SaveWeekBits(
        Request({DaySubmission{kMonday, {RawWindow{"09:00:00", "11:00:00"}, RawWindow{"10:30:00", "12:00:00"}}}}));
  } catch (const availability::util::OverlapConflict& e) {
    caught = true;
    assert(e.Date() == "2024-06-10");
    assert(e.First() == "09:00:00-11:00:00");
    assert(e.Second() == "10:30:00-12:00:00");
  }
  assert(caught);

  assert(Throws<availability::util::OverlapConflict>([&] {
    f.engine->SaveWeekBits(
        Request({DaySubmission{kMonday, {RawWindow{"10:30:00", "12:00:00"}, RawWindow{"09:00:00", "11:00:00"}}}}));
  }));
  assert(f.store->GetRange("instructor-1", kMonday, kMonday + std::chrono::days{6}).empty());
}

void TestOverlapWithPersistedWindow() {
  auto f = MakeFixture();
  f.engine->SaveWeekBits(Request({DaySubmission{kMonday, {RawWindow{"09:00:00", "12:00:00"}}}}));

  bool caught = false;
  try {
    f.engine->SaveWeekBits(Request({DaySubmission{kMonday, {RawWindow{"11:00:00", "13:00:00"}}}}));
  } catch (const availability::util::OverlapConflict& e) {
    caught = true;
    assert(e.First() == "09:00:00-12:00:00");
    assert(e.Second() == "11:00:00-13:00:00");
  }
  assert(caught);
  assert(DayWindows(*f.engine, kMonday) == std::vector<std::string>{"09:00:00-12:00:00"});

  // Identical to a persisted window: unchanged, not a conflict.
  const auto same = f.engine->SaveWeekBits(Request({DaySubmission{kMonday, {RawWindow{"09:00:00", "12:00:00"}}}}));
  assert(same.rows_written == 0);

  // Explicitly ignoring persisted windows merges without the check.
  auto request            = Request({DaySubmission{kMonday, {RawWindow{"11:00:00", "13:00:00"}}}});
  request.ignore_existing = true;
  f.engine->SaveWeekBits(request);
  assert(DayWindows(*f.engine, kMonday) == std::vector<std::string>{"09:00:00-13:00:00"});
}

void TestWindowInsideCoalescedRunIsUnchanged() {
  auto f = MakeFixture();
  f.engine->SaveWeekBits(Request({DaySubmission{kMonday, {RawWindow{"09:00:00", "10:00:00"}}}}));
  f.engine->SaveWeekBits(Request({DaySubmission{kMonday, {RawWindow{"10:00:00", "11:00:00"}}}}));
  assert(DayWindows(*f.engine, kMonday) == std::vector<std::string>{"09:00:00-11:00:00"});
  const auto version = f.engine->GetWeekAvailability("instructor-1", kMonday, false).version;

  // Stored as one 09-11 run; resubmitting either half changes nothing.
  const auto first = f.engine->SaveWeekBits(Request({DaySubmission{kMonday, {RawWindow{"09:00:00", "10:00:00"}}}}));
  assert(first.rows_written == 0);
  assert(first.version == version);
  const auto second = f.engine->SaveWeekBits(Request({DaySubmission{kMonday, {RawWindow{"10:00:00", "11:00:00"}}}}));
  assert(second.rows_written == 0);

  // Sticking out of the run is still a conflict.
  assert(Throws<availability::util::OverlapConflict>(
      [&] { f.engine->SaveWeekBits(Request({DaySubmission{kMonday, {RawWindow{"10:30:00", "11:30:00"}}}})); }));
  assert(DayWindows(*f.engine, kMonday) == std::vector<std::string>{"09:00:00-11:00:00"});
}

void TestMalformedInputFailsBeforePersistence() {
  auto f = MakeFixture();

  assert(Throws<availability::util::ValidationFailure>(
      [&] { f.engine->SaveWeekBits(Request({DaySubmission{kMonday, {RawWindow{"09:15:00", "10:00:00"}}}})); }));
  assert(Throws<availability::util::ValidationFailure>(
      [&] { f.engine->SaveWeekBits(Request({DaySubmission{kMonday, {RawWindow{"12:00:00", "09:00:00"}}}})); }));
  assert(Throws<availability::util::ValidationFailure>([&] {
    f.engine->SaveWeekBits(Request({DaySubmission{kMonday + std::chrono::days{7}, {RawWindow{"09:00:00", "10:00:00"}}}}));
  }));
  assert(Throws<availability::util::ValidationFailure>([&] {
    auto request       = Request({});
    request.week_start = kTuesday;
    f.engine->SaveWeekBits(request);
  }));
  assert(Throws<availability::util::ValidationFailure>([&] {
    auto request          = Request({DaySubmission{kMonday, {RawWindow{"09:00:00", "10:00:00"}}}});
    request.instructor_id = "";
    f.engine->SaveWeekBits(request);
  }));

  assert(f.store->GetRange("instructor-1", kMonday, kMonday + std::chrono::days{6}).empty());
}

void TestStaleVersionIsRejectedAndOverrideBypasses() {
  auto f = MakeFixture();

  const auto initial = f.engine->GetWeekAvailability("instructor-1", kMonday).version;

  auto first         = Request({DaySubmission{kMonday, {RawWindow{"09:00:00", "10:00:00"}}}});
  first.base_version = initial;
  const auto written = f.engine->SaveWeekBits(first);
  assert(written.version != initial);

  auto stale         = Request({DaySubmission{kTuesday, {RawWindow{"09:00:00", "10:00:00"}}}});
  stale.base_version = initial;
  bool caught        = false;
  try {
    f.engine->SaveWeekBits(stale);
  } catch (const availability::util::VersionConflict& e) {
    caught = true;
    assert(e.Expected() == initial);
    assert(e.Current() == written.version);
  }
  assert(caught);
  assert(DayWindows(*f.engine, kTuesday).empty());

  stale.override = true;
  f.engine->SaveWeekBits(stale);
  assert(DayWindows(*f.engine, kTuesday) == std::vector<std::string>{"09:00:00-10:00:00"});

  auto fresh         = Request({DaySubmission{kSaturday, {RawWindow{"10:00:00", "11:00:00"}}}});
  fresh.base_version = f.engine->GetWeekAvailability("instructor-1", kMonday, false).version;
  f.engine->SaveWeekBits(fresh);
}

void TestForbidPastEditsSkipsEarlierDates() {
  EngineOptions options;
  options.past_edit_policy = PastEditPolicy::kForbid;
  auto f                   = MakeFixture(options, kTuesday);

  const auto result = f.engine->SaveWeekBits(Request({DaySubmission{kMonday, {RawWindow{"09:00:00", "10:00:00"}}},
                                                      DaySubmission{kTuesday, {RawWindow{"09:00:00", "10:00:00"}}}}));

  assert(result.skipped.past_forbidden == 1);
  assert(result.skipped.past_window == 0);
  assert(result.days_written == 1);
  assert(DayWindows(*f.engine, kMonday).empty());
  assert(DayWindows(*f.engine, kTuesday) == std::vector<std::string>{"09:00:00-10:00:00"});
}

void TestForbidPastEditsProtectsPastDaysFromWeekClear() {
  auto f = MakeFixture();
  f.engine->SaveWeekBits(Request({DaySubmission{kMonday, {RawWindow{"09:00:00", "10:00:00"}}}}));

  EngineOptions options;
  options.past_edit_policy = PastEditPolicy::kForbid;
  AvailabilityEngine guarded(f.store, availability::cache::SafeCache{}, std::make_shared<availability::clock::FixedDateResolver>(kTuesday),
                             options);

  auto request           = Request({DaySubmission{kTuesday, {RawWindow{"11:00:00", "12:00:00"}}}});
  request.clear_existing = true;
  guarded.SaveWeekBits(request);

  assert(DayWindows(guarded, kMonday) == std::vector<std::string>{"09:00:00-10:00:00"});
}

void TestPastEditWindowSkipsOlderDates() {
  EngineOptions options;
  options.past_edit_policy      = PastEditPolicy::kWindow;
  options.past_edit_window_days = 2;
  auto f                        = MakeFixture(options, ParseIsoDate("2024-06-16"));

  const auto result = f.engine->SaveWeekBits(Request({DaySubmission{kMonday, {RawWindow{"09:00:00", "10:00:00"}, RawWindow{"11:00:00", "12:00:00"}}},
                                                      DaySubmission{kSaturday, {RawWindow{"09:00:00", "10:00:00"}}}}));

  assert(result.skipped.past_window == 2);
  assert(result.skipped.past_forbidden == 0);
  assert(DayWindows(*f.engine, kMonday).empty());
  assert(DayWindows(*f.engine, kSaturday) == std::vector<std::string>{"09:00:00-10:00:00"});
}

void TestWritesToOtherWeeksDoNotConflict() {
  auto       f         = MakeFixture();
  const Date next_week = kMonday + std::chrono::days{7};

  // Other instructors, other weeks and blackouts commit while this week's write is open.
  const auto result = f.store->MutateWeek("instructor-2", kMonday, [&](const availability::store::StoredWeek&) {
    f.engine->SaveWeekBits(Request({DaySubmission{kMonday, {RawWindow{"09:00:00", "10:00:00"}}}}));

    auto later       = Request({DaySubmission{next_week, {RawWindow{"12:00:00", "13:00:00"}}}});
    later.week_start = next_week;
    f.engine->SaveWeekBits(later);

    assert(f.engine->AddBlackoutDate("instructor-1", kSaturday, "holiday").has_value());

    availability::store::WeekWrite write;
    write.days[kMonday] = availability::bitmap::Encode({availability::bitmap::Window{600, 660}});
    return write;
  });

  assert(result.rows_changed == 1);
  assert(f.store->GetDay("instructor-2", kMonday).has_value());
  assert(DayWindows(*f.engine, kMonday) == std::vector<std::string>{"09:00:00-10:00:00"});
  assert(DayWindows(*f.engine, next_week) == std::vector<std::string>{"12:00:00-13:00:00"});
}

void TestConcurrentWriteToSameWeekConflicts() {
  auto f = MakeFixture();

  assert(Throws<availability::util::VersionConflict>([&] {
    f.store->MutateWeek("instructor-1", kMonday, [&](const availability::store::StoredWeek&) {
      f.engine->SaveWeekBits(Request({DaySubmission{kTuesday, {RawWindow{"08:00:00", "09:00:00"}}}}));

      availability::store::WeekWrite write;
      write.days[kMonday] = availability::bitmap::Encode({availability::bitmap::Window{600, 660}});
      return write;
    });
  }));

  assert(DayWindows(*f.engine, kMonday).empty());
  assert(DayWindows(*f.engine, kTuesday) == std::vector<std::string>{"08:00:00-09:00:00"});
}

void TestLostCommitRaceReportsBothVersions() {
  auto repository = std::make_shared<availability::test::HookedRepository>(std::make_shared<availability::db::memory::MemoryRepository>());
  auto store      = std::make_shared<availability::store::DayStore>(repository);
  AvailabilityEngine engine(store, availability::cache::SafeCache{},
                            std::make_shared<availability::clock::FixedDateResolver>(ParseIsoDate("2024-06-03")), EngineOptions{});

  const auto base = engine.GetWeekAvailability("instructor-1", kMonday, false).version;

  // A rival writer commits to the same week after the save has read it.
  availability::store::DayStore rival(repository);
  repository->after_lock = [&] {
    rival.UpsertWeek("instructor-1", kMonday, {{kTuesday, availability::bitmap::Encode({availability::bitmap::Window{840, 900}})}});
  };

  auto request         = Request({DaySubmission{kMonday, {RawWindow{"09:00:00", "10:00:00"}}}});
  request.base_version = base;

  bool caught = false;
  try {
    engine.SaveWeekBits(request);
  } catch (const availability::util::VersionConflict& e) {
    caught = true;
    assert(e.Expected() == base);
    assert(!e.Current().empty());
    assert(e.Current() != base);
    assert(e.Current() == engine.GetWeekAvailability("instructor-1", kMonday, false).version);
  }
  assert(caught);
  assert(DayWindows(engine, kMonday).empty());
  assert(DayWindows(engine, kTuesday) == std::vector<std::string>{"14:00:00-15:00:00"});
}

void TestAuditAndOutboxAreWrittenWithTheWeek() {
  auto f = MakeFixture();
  f.engine->SaveWeekBits(Request({DaySubmission{kMonday, {RawWindow{"09:00:00", "10:00:00"}}},
                                  DaySubmission{kTuesday, {RawWindow{"09:00:00", "10:00:00"}}}}));

  const auto outbox = f.store->ListOutbox();
  assert(outbox.size() == 1);
  assert(outbox[0].event_type == "availability.week_saved");
  assert(outbox[0].aggregate_id == "instructor-1:2024-06-10");
  assert(outbox[0].payload_json.find("2024-06-10") != std::string::npos);
  assert(outbox[0].payload_json.find("2024-06-11") != std::string::npos);

  const auto audit = f.store->ListAudit("instructor-1");
  assert(audit.size() == 1);
  assert(audit[0].action == "save_week");
  assert(audit[0].target_date == "2024-06-10");
  assert(audit[0].after_json.find("09:00:00") != std::string::npos);
}

void TestAuditCanBeDisabled() {
  EngineOptions options;
  options.audit_enabled = false;
  auto f                = MakeFixture(options);
  f.engine->SaveWeekBits(Request({DaySubmission{kMonday, {RawWindow{"09:00:00", "10:00:00"}}}}));

  assert(f.store->ListAudit("instructor-1").empty());
  assert(f.store->ListOutbox().size() == 1);
}

void TestPastOnlyEventsCanBeSuppressed() {
  EngineOptions options;
  options.suppress_past_events = true;
  auto f                       = MakeFixture(options, ParseIsoDate("2024-06-20"));
  f.engine->SaveWeekBits(Request({DaySubmission{kMonday, {RawWindow{"09:00:00", "10:00:00"}}}}));

  assert(f.store->ListOutbox().empty());
  assert(f.store->ListAudit("instructor-1").size() == 1);
}

void TestReadsAlwaysReturnSevenDays() {
  auto       f    = MakeFixture();
  const auto week = f.engine->GetWeekAvailability("instructor-1", kMonday);
  for (std::size_t i = 0; i < week.days.size(); ++i) {
    assert(week.days[i].date == kMonday + std::chrono::days{static_cast<int>(i)});
    assert(week.days[i].windows.empty());
  }
  assert(!f.engine->GetWeekLastModified("instructor-1", kMonday).has_value());
  assert(!f.engine->GetAvailabilityForDate("instructor-1", kMonday).has_value());
}

void TestSlotsViewListsEveryHalfHour() {
  auto f = MakeFixture();
  f.engine->SaveWeekBits(Request({DaySubmission{kTuesday, {RawWindow{"09:00:00", "10:30:00"}}}}));

  const auto slots = f.engine->GetWeekAvailabilityWithSlots("instructor-1", kMonday);
  assert(slots.slots.size() == 3);
  assert(slots.slots[0].date == kTuesday);
  assert(availability::bitmap::FormatWindow(slots.slots[2].window) == "10:00:00-10:30:00");
  assert(f.engine->GetWeekLastModified("instructor-1", kMonday).has_value());
}

} // namespace

int main() {
  TestScenarioSingleWindowSaveAndAdmission();
  TestScenarioIdenticalResaveKeepsVersion();
  TestMergeKeepsUnrelatedWindows();
  TestReplaceRebuildsWeekFromSubmission();
  TestDayScopedClearLeavesOtherDays();
  TestListedEmptyDayClearsAndAbsentDayIsUnchanged();
  TestSiblingOverlapIsRejectedInEitherOrder();
  TestOverlapWithPersistedWindow();
  TestWindowInsideCoalescedRunIsUnchanged();
  TestMalformedInputFailsBeforePersistence();
  TestStaleVersionIsRejectedAndOverrideBypasses();
  TestForbidPastEditsSkipsEarlierDates();
  TestForbidPastEditsProtectsPastDaysFromWeekClear();
  TestPastEditWindowSkipsOlderDates();
  TestWritesToOtherWeeksDoNotConflict();
  TestConcurrentWriteToSameWeekConflicts();
  TestLostCommitRaceReportsBothVersions();
  TestAuditAndOutboxAreWrittenWithTheWeek();
  TestAuditCanBeDisabled();
  TestPastOnlyEventsCanBeSuppressed();
  TestReadsAlwaysReturnSevenDays();
  TestSlotsViewListsEveryHalfHour();

  std::cout << "availability_unit_availability_engine: pass\n";
  return 0;
}
