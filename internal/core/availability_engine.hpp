#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/bitmap/bit_codec.hpp"
#include "internal/cache/safe_cache.hpp"
#include "internal/core/engine_options.hpp"
#include "internal/db/model/blackout_record.hpp"
#include "internal/util/date.hpp"

namespace availability::clock {
class LocalDateResolver;
}
namespace availability::store {
class DayStore;
}

namespace availability::core {

// Window as it arrives on the wire, before grid validation.
struct RawWindow {
  std::string start;
  std::string end;
};

struct DaySubmission {
  util::Date             date{};
  std::vector<RawWindow> windows;
};

struct SaveWeekRequest {
  std::string                instructor_id;
  util::Date                 week_start{};
  std::vector<DaySubmission> days;
  std::optional<std::string> base_version;
  bool                       override        = false;
  bool                       clear_existing  = false;
  std::set<util::Date>       clear_dates;
  bool                       ignore_existing = false;
  std::string                actor_id;
};

struct DayView {
  util::Date                  date{};
  std::vector<bitmap::Window> windows;
};

struct WeekView {
  util::Date                      week_start{};
  std::array<DayView, util::kDaysPerWeek> days;
  std::string                     version;
};

struct SlotView {
  util::Date     date{};
  bitmap::Window window;
};

struct WeekSlots {
  WeekView              week;
  std::vector<SlotView> slots;
};

struct GuardrailSkips {
  int past_forbidden = 0;
  int past_window    = 0;
};

struct SaveWeekResult {
  // Submitted days that survived the guardrails.
  int            days_written = 0;
  // Stored rows whose bits changed.
  int            rows_written = 0;
  std::string    version;
  GuardrailSkips skipped;
  WeekView       week;
};

struct WeekOperationResult {
  int            weeks_written = 0;
  int            days_written  = 0;
  GuardrailSkips skipped;
};

struct RetentionResult {
  uint64_t   rows_purged = 0;
  util::Date cutoff{};
  bool       dry_run     = false;
};

/*
  AvailabilityEngine

  Owns every read and write of weekly availability:

    - reads go week cache -> day cache -> DayStore, cache failures count as
      misses;
    - writes validate synchronously, apply past-date guardrails, check the
      week version and commit rows, audit and outbox in one DayStore
      transaction;
    - after a commit the affected cache keys are invalidated and re-warmed.

  Thread-safe; holds no mutable state of its own. Conflicts are never
  retried here.
*/
class AvailabilityEngine {
 public:
  AvailabilityEngine(std::shared_ptr<store::DayStore> store, cache::SafeCache cache, std::shared_ptr<clock::LocalDateResolver> clock,
                     EngineOptions options);

  const EngineOptions& Options() const {
    return options_;
  }

  // Reads

  bitmap::WeekBits GetWeekBits(const std::string& instructor_id, util::Date week_start, bool use_cache = true) const;
  bitmap::DayBits  GetDayBits(const std::string& instructor_id, util::Date date, bool use_cache = true) const;

  WeekView                GetWeekAvailability(const std::string& instructor_id, util::Date week_start, bool use_cache = true) const;
  WeekSlots               GetWeekAvailabilityWithSlots(const std::string& instructor_id, util::Date week_start) const;
  std::optional<uint64_t> GetWeekLastModified(const std::string& instructor_id, util::Date week_start) const;

  // Empty when the date has no availability.
  std::optional<std::vector<bitmap::Window>> GetAvailabilityForDate(const std::string& instructor_id, util::Date date) const;

  // Window count per date, only for dates that have availability.
  std::map<util::Date, int> GetAvailabilitySummary(const std::string& instructor_id, util::Date first, util::Date last) const;
  std::vector<DayView>      GetAvailabilityForRange(const std::string& instructor_id, util::Date first, util::Date last) const;

  // Writes

  SaveWeekResult SaveWeekBits(const SaveWeekRequest& request);

  SaveWeekResult AddSpecificDateAvailability(const std::string& instructor_id, util::Date date, const RawWindow& window,
                                             const std::string& actor_id);

  WeekOperationResult CopyWeek(const std::string& instructor_id, util::Date from_week, util::Date to_week, const std::string& actor_id);
  WeekOperationResult ApplyPatternToRange(const std::string& instructor_id, util::Date from_week, util::Date first, util::Date last,
                                          const std::string& actor_id);

  // Empty when the date is skipped by the past-edit guardrail.
  std::optional<db::model::BlackoutRecord> AddBlackoutDate(const std::string& instructor_id, util::Date date, const std::string& reason);
  std::vector<db::model::BlackoutRecord>   ListBlackoutDates(const std::string& instructor_id) const;
  void                                     DeleteBlackoutDate(const std::string& instructor_id, const std::string& id);

  RetentionResult PurgeRetention(std::optional<bool> dry_run);

 private:
  struct PlannedDay {
    bitmap::DayBits             bits;
    std::vector<bitmap::Window> windows;
    bool                        replace = false;
  };

  struct WeekPlan {
    std::string                      instructor_id;
    util::Date                       week_start{};
    std::map<util::Date, PlannedDay> days;
    std::optional<std::string>       base_version;
    bool                             check_existing = true;
    std::string                      action;
    std::string                      actor_id;
  };

  struct WeekCommit {
    int              rows_changed = 0;
    bitmap::WeekBits bits;
  };

  enum class Guard {
    kNone,
    kPastForbidden,
    kPastWindow,
  };

  Guard GuardFor(util::Date date, util::Date today) const;
  void  CountSkip(Guard guard, int count, GuardrailSkips& skips) const;

  SaveWeekResult SaveWeekImpl(const SaveWeekRequest& request, const std::string& action);
  WeekCommit     CommitPlan(const WeekPlan& plan, util::Date today);

  void RefreshCache(const std::string& instructor_id, util::Date week_start, const bitmap::WeekBits& computed) const;
  void StoreWeekInCache(const std::string& instructor_id, util::Date week_start, const bitmap::WeekBits& bits) const;

  WeekView ToWeekView(util::Date week_start, const bitmap::WeekBits& bits) const;

  std::shared_ptr<store::DayStore>          store_;
  cache::SafeCache                          cache_;
  std::shared_ptr<clock::LocalDateResolver> clock_;
  EngineOptions                             options_;
};

} // namespace availability::core
