#include "internal/core/booking_admission.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/clock/local_date_resolver.hpp"
#include "internal/core/availability_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/store/day_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using availability::core::AdmissionReason;
using availability::core::AvailabilityEngine;
using availability::core::BookingAdmission;
using availability::core::DaySubmission;
using availability::core::RawWindow;
using availability::core::SaveWeekRequest;
using availability::util::ParseIsoDate;

const auto kMonday  = ParseIsoDate("2024-06-10");
const auto kTuesday = ParseIsoDate("2024-06-11");

struct Fixture {
  std::shared_ptr<AvailabilityEngine> engine;
  std::unique_ptr<BookingAdmission>   admission;
};

// Monday 18:00-24:00, Tuesday 00:00-02:00 and 09:00-10:00.
Fixture MakeFixture() {
  Fixture f;
  f.engine = std::make_shared<AvailabilityEngine>(
      std::make_shared<availability::store::DayStore>(std::make_shared<availability::db::memory::MemoryRepository>()),
      availability::cache::SafeCache{}, std::make_shared<availability::clock::FixedDateResolver>(ParseIsoDate("2024-06-03")),
      availability::core::EngineOptions{});
  f.admission = std::make_unique<BookingAdmission>(f.engine);

  SaveWeekRequest request;
  request.instructor_id = "instructor-1";
  request.week_start    = kMonday;
  request.days          = {DaySubmission{kMonday, {RawWindow{"18:00:00", "24:00:00"}}},
                           DaySubmission{kTuesday, {RawWindow{"00:00:00", "02:00:00"}, RawWindow{"09:00:00", "10:00:00"}}}};
  f.engine->SaveWeekBits(request);
  return f;
}

void TestCoveredIntervalIsAdmitted() {
  auto       f      = MakeFixture();
  const auto result = f.admission->Check("instructor-1", kTuesday, "09:00:00", "10:00:00");
  assert(result.available);
  assert(result.reason == AdmissionReason::kAvailable);
}

void TestPartiallyCoveredIntervalIsRejected() {
  auto       f      = MakeFixture();
  const auto result = f.admission->Check("instructor-1", kTuesday, "09:30:00", "10:30:00");
  assert(!result.available);
  assert(result.reason == AdmissionReason::kSlotUnavailable);
}

void TestEmptyDayReportsNoAvailability() {
  auto       f      = MakeFixture();
  const auto result = f.admission->Check("instructor-1", kMonday + std::chrono::days{3}, "09:00:00", "10:00:00");
  assert(!result.available);
  assert(result.reason == AdmissionReason::kNoAvailability);
}

void TestEndOfDaySentinel() {
  auto f = MakeFixture();
  assert(f.admission->Check("instructor-1", kMonday, "23:30:00", "24:00:00").available);
}

void TestIntervalCrossingMidnight() {
  auto f = MakeFixture();
  assert(f.admission->Check("instructor-1", kMonday, "23:00:00", "01:00:00").available);
  assert(f.admission->Check("instructor-1", kMonday, "22:00:00", "00:00:00").available);

  const auto too_long = f.admission->Check("instructor-1", kMonday, "23:00:00", "03:00:00");
  assert(!too_long.available);
  assert(too_long.reason == AdmissionReason::kSlotUnavailable);
}

void TestMalformedIntervalsThrow() {
  auto f = MakeFixture();

  bool caught = false;
  try {
    f.admission->Check("instructor-1", kMonday, "10:00:00", "10:00:00");
  } catch (const availability::util::ValidationFailure&) {
    caught = true;
  }
  assert(caught);

  caught = false;
  try {
    f.admission->Check("instructor-1", kMonday, "10:15:00", "11:00:00");
  } catch (const availability::util::ValidationFailure&) {
    caught = true;
  }
  assert(caught);

  caught = false;
  try {
    f.admission->Check("instructor-1", kMonday, "24:00:00", "01:00:00");
  } catch (const availability::util::ValidationFailure&) {
    caught = true;
  }
  assert(caught);
}

} // namespace

int main() {
  TestCoveredIntervalIsAdmitted();
  TestPartiallyCoveredIntervalIsRejected();
  TestEmptyDayReportsNoAvailability();
  TestEndOfDaySentinel();
  TestIntervalCrossingMidnight();
  TestMalformedIntervalsThrow();

  std::cout << "availability_unit_booking_admission: pass\n";
  return 0;
}
