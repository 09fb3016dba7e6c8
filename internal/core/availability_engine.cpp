#include "availability_engine.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <stdexcept>

#include "availability/engine/v1/types.pb.h"
#include "internal/clock/local_date_resolver.hpp"
#include "internal/core/week_version.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/store/day_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace availability::core {

namespace v1 = availability::engine::v1;

using observability::DateField;
using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kWeekSavedEvent = "availability.week_saved";

// Longest range accepted by range reads and pattern application.
constexpr int kMaxRangeDays = 366;

void RequireInstructor(const std::string& instructor_id) {
  if (instructor_id.empty()) {
    throw util::ValidationFailure("instructor_id is required");
  }
}

void RequireMonday(util::Date date, const std::string& what) {
  if (!util::IsMonday(date)) {
    throw util::ValidationFailure(what + " " + util::FormatIsoDate(date) + " is not a Monday");
  }
}

void RequireRange(util::Date first, util::Date last) {
  if (last < first) {
    throw util::ValidationFailure("end date " + util::FormatIsoDate(last) + " is before start date " + util::FormatIsoDate(first));
  }
  if ((last - first).count() >= kMaxRangeDays) {
    throw util::ValidationFailure("date range exceeds " + std::to_string(kMaxRangeDays) + " days");
  }
}

std::size_t DayIndex(util::Date week_start, util::Date date) {
  return static_cast<std::size_t>((date - week_start).count());
}

// New-vs-new: any two submitted windows of one date must be disjoint.
void CheckSiblings(util::Date date, const std::vector<bitmap::Window>& windows) {
  for (std::size_t i = 0; i < windows.size(); ++i) {
    const auto bits = bitmap::WindowBits(windows[i]);
    for (std::size_t j = i + 1; j < windows.size(); ++j) {
      if (bitmap::Overlaps(bits, bitmap::WindowBits(windows[j]))) {
        observability::Metrics::Instance().RecordWriteConflict("overlap");
        throw util::OverlapConflict(util::FormatIsoDate(date), bitmap::FormatWindow(windows[i]), bitmap::FormatWindow(windows[j]));
      }
    }
  }
}

// New-vs-persisted. A window whose slots are all already set is unchanged,
// even when the stored run around it is longer.
void CheckPersisted(util::Date date, const bitmap::DayBits& persisted_bits, const std::vector<bitmap::Window>& windows) {
  if (persisted_bits.none()) {
    return;
  }

  const auto persisted = bitmap::Decode(persisted_bits);
  for (const auto& window : windows) {
    const auto bits = bitmap::WindowBits(window);
    if (bitmap::Covers(persisted_bits, bits) || !bitmap::Overlaps(bits, persisted_bits)) {
      continue;
    }
    for (const auto& existing : persisted) {
      if (bitmap::Overlaps(bitmap::WindowBits(existing), bits)) {
        observability::Metrics::Instance().RecordWriteConflict("overlap");
        throw util::OverlapConflict(util::FormatIsoDate(date), bitmap::FormatWindow(existing), bitmap::FormatWindow(window));
      }
    }
  }
}

std::string ToJson(const google::protobuf::Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize " + std::string(message.GetTypeName()) + " to JSON: " + std::string(status.message()));
  }
  return json;
}

void AppendDay(v1::WindowSnapshot& snapshot, util::Date date, const bitmap::DayBits& bits) {
  auto* day = snapshot.add_days();
  day->set_date(util::FormatIsoDate(date));
  for (const auto& window : bitmap::Decode(bits)) {
    auto* out = day->add_windows();
    out->set_start_time(bitmap::FormatTimeOfDay(window.start_minute));
    out->set_end_time(bitmap::FormatTimeOfDay(window.end_minute));
  }
}

std::string SerializeWeek(const std::string& instructor_id, util::Date week_start, const bitmap::WeekBits& bits) {
  v1::WeekSnapshot snapshot;
  snapshot.set_instructor_id(instructor_id);
  snapshot.set_week_start(util::FormatIsoDate(week_start));
  for (const auto& day : bits) {
    snapshot.add_day_bits(bitmap::Pack(day));
  }
  snapshot.set_version(ComputeWeekVersion(bits));
  return snapshot.SerializeAsString();
}

std::optional<bitmap::WeekBits> ParseWeek(const std::string& payload, const std::string& instructor_id, util::Date week_start) {
  v1::WeekSnapshot snapshot;
  if (!snapshot.ParseFromString(payload) || snapshot.day_bits_size() != util::kDaysPerWeek || snapshot.instructor_id() != instructor_id ||
      snapshot.week_start() != util::FormatIsoDate(week_start)) {
    return std::nullopt;
  }

  bitmap::WeekBits bits;
  try {
    for (int i = 0; i < util::kDaysPerWeek; ++i) {
      bits[static_cast<std::size_t>(i)] = bitmap::Unpack(snapshot.day_bits(i));
    }
  } catch (const std::runtime_error&) {
    return std::nullopt;
  }
  return bits;
}

} // namespace

AvailabilityEngine::AvailabilityEngine(std::shared_ptr<store::DayStore> store, cache::SafeCache cache,
                                       std::shared_ptr<clock::LocalDateResolver> clock, EngineOptions options)
    : store_(std::move(store)), cache_(std::move(cache)), clock_(std::move(clock)), options_(options) {
  if (!store_) {
    throw std::invalid_argument("AvailabilityEngine requires a day store");
  }
  if (!clock_) {
    throw std::invalid_argument("AvailabilityEngine requires a local date resolver");
  }
  if (options_.past_edit_policy == PastEditPolicy::kWindow && options_.past_edit_window_days < 0) {
    throw std::invalid_argument("past_edit_window_days must not be negative");
  }
}

/*
  Reads
*/

bitmap::DayBits AvailabilityEngine::GetDayBits(const std::string& instructor_id, util::Date date, bool use_cache) const {
  RequireInstructor(instructor_id);

  const auto key = cache::DayKey(instructor_id, date);
  if (use_cache) {
    if (auto cached = cache_.Get(cache::CacheNamespace::kDay, key)) {
      try {
        return bitmap::Unpack(*cached);
      } catch (const std::runtime_error& e) {
        AVAILABILITY_LOG_WARN("discarding malformed cached day", {StringField("instructor_id", instructor_id), DateField("date", date),
                                                                  StringField("error", e.what())});
        cache_.Invalidate(cache::CacheNamespace::kDay, key);
      }
    }
  }

  const auto stored = store_->GetDay(instructor_id, date);
  const auto bits   = stored ? stored->bits : bitmap::DayBits{};
  if (use_cache) {
    cache_.Set(cache::CacheNamespace::kDay, key, bitmap::Pack(bits), options_.day_cache_ttl);
  }
  return bits;
}

bitmap::WeekBits AvailabilityEngine::GetWeekBits(const std::string& instructor_id, util::Date week_start, bool use_cache) const {
  RequireInstructor(instructor_id);
  RequireMonday(week_start, "week_start");

  if (use_cache) {
    const auto week_key = cache::WeekKey(instructor_id, week_start);
    if (auto cached = cache_.Get(cache::CacheNamespace::kWeek, week_key)) {
      if (auto bits = ParseWeek(*cached, instructor_id, week_start)) {
        return *bits;
      }
      AVAILABILITY_LOG_WARN("discarding malformed cached week",
                            {StringField("instructor_id", instructor_id), DateField("week_start", week_start)});
      cache_.Invalidate(cache::CacheNamespace::kWeek, week_key);
    }

    // All seven day entries present is as good as the week entry.
    bitmap::WeekBits bits;
    bool             complete = true;
    for (int i = 0; i < util::kDaysPerWeek && complete; ++i) {
      const auto date   = week_start + std::chrono::days{i};
      auto       cached = cache_.Get(cache::CacheNamespace::kDay, cache::DayKey(instructor_id, date));
      if (!cached) {
        complete = false;
        break;
      }
      try {
        bits[static_cast<std::size_t>(i)] = bitmap::Unpack(*cached);
      } catch (const std::runtime_error&) {
        complete = false;
      }
    }
    if (complete) {
      cache_.Set(cache::CacheNamespace::kWeek, week_key, SerializeWeek(instructor_id, week_start, bits), options_.week_cache_ttl);
      return bits;
    }
  }

  const auto bits = store_->GetWeek(instructor_id, week_start).Bits();
  if (use_cache) {
    StoreWeekInCache(instructor_id, week_start, bits);
  }
  return bits;
}

WeekView AvailabilityEngine::GetWeekAvailability(const std::string& instructor_id, util::Date week_start, bool use_cache) const {
  return ToWeekView(week_start, GetWeekBits(instructor_id, week_start, use_cache));
}

WeekSlots AvailabilityEngine::GetWeekAvailabilityWithSlots(const std::string& instructor_id, util::Date week_start) const {
  const auto bits = GetWeekBits(instructor_id, week_start);

  WeekSlots out;
  out.week = ToWeekView(week_start, bits);
  for (int day = 0; day < util::kDaysPerWeek; ++day) {
    const auto& day_bits = bits[static_cast<std::size_t>(day)];
    for (int slot = 0; slot < bitmap::kSlotsPerDay; ++slot) {
      if (!day_bits.test(static_cast<std::size_t>(slot))) {
        continue;
      }
      SlotView view;
      view.date                = week_start + std::chrono::days{day};
      view.window.start_minute = slot * bitmap::kSlotMinutes;
      view.window.end_minute   = view.window.start_minute + bitmap::kSlotMinutes;
      out.slots.push_back(view);
    }
  }
  return out;
}

std::optional<uint64_t> AvailabilityEngine::GetWeekLastModified(const std::string& instructor_id, util::Date week_start) const {
  RequireInstructor(instructor_id);
  RequireMonday(week_start, "week_start");
  return store_->GetWeek(instructor_id, week_start).LastModifiedMs();
}

std::optional<std::vector<bitmap::Window>> AvailabilityEngine::GetAvailabilityForDate(const std::string& instructor_id,
                                                                                      util::Date         date) const {
  const auto bits = GetDayBits(instructor_id, date);
  if (bits.none()) {
    return std::nullopt;
  }
  return bitmap::Decode(bits);
}

std::map<util::Date, int> AvailabilityEngine::GetAvailabilitySummary(const std::string& instructor_id, util::Date first,
                                                                     util::Date last) const {
  RequireInstructor(instructor_id);
  RequireRange(first, last);

  std::map<util::Date, int> counts;
  for (const auto& day : store_->GetRange(instructor_id, first, last)) {
    if (day.bits.any()) {
      counts[day.date] = static_cast<int>(bitmap::Decode(day.bits).size());
    }
  }
  return counts;
}

std::vector<DayView> AvailabilityEngine::GetAvailabilityForRange(const std::string& instructor_id, util::Date first,
                                                                 util::Date last) const {
  RequireInstructor(instructor_id);
  RequireRange(first, last);

  std::vector<DayView> out;
  for (const auto& day : store_->GetRange(instructor_id, first, last)) {
    if (day.bits.any()) {
      out.push_back(DayView{day.date, bitmap::Decode(day.bits)});
    }
  }
  return out;
}

/*
  Writes
*/

SaveWeekResult AvailabilityEngine::SaveWeekBits(const SaveWeekRequest& request) {
  return SaveWeekImpl(request, "save_week");
}

SaveWeekResult AvailabilityEngine::AddSpecificDateAvailability(const std::string& instructor_id, util::Date date, const RawWindow& window,
                                                               const std::string& actor_id) {
  SaveWeekRequest request;
  request.instructor_id = instructor_id;
  request.week_start    = util::MondayOf(date);
  request.days.push_back(DaySubmission{date, {window}});
  request.actor_id = actor_id;
  return SaveWeekImpl(request, "add_specific_date");
}

SaveWeekResult AvailabilityEngine::SaveWeekImpl(const SaveWeekRequest& request, const std::string& action) {
  RequireInstructor(request.instructor_id);
  RequireMonday(request.week_start, "week_start");

  const auto week_start = request.week_start;
  const auto week_end   = week_start + std::chrono::days{util::kDaysPerWeek - 1};
  const auto in_week    = [&](util::Date date) { return date >= week_start && date <= week_end; };

  // Everything malformed fails here, before any read or write.
  std::map<util::Date, std::vector<bitmap::Window>> submitted;
  for (const auto& day : request.days) {
    if (!in_week(day.date)) {
      throw util::ValidationFailure("date " + util::FormatIsoDate(day.date) + " is outside the week starting " +
                                    util::FormatIsoDate(week_start));
    }
    if (submitted.count(day.date) > 0) {
      throw util::ValidationFailure("date " + util::FormatIsoDate(day.date) + " is submitted more than once");
    }

    std::vector<bitmap::Window> windows;
    windows.reserve(day.windows.size());
    for (const auto& raw : day.windows) {
      windows.push_back(bitmap::ParseWindow(raw.start, raw.end));
    }
    CheckSiblings(day.date, windows);
    submitted.emplace(day.date, std::move(windows));
  }
  for (const auto& date : request.clear_dates) {
    if (!in_week(date)) {
      throw util::ValidationFailure("clear date " + util::FormatIsoDate(date) + " is outside the week starting " +
                                    util::FormatIsoDate(week_start));
    }
  }

  const auto today = clock_->Today(request.instructor_id);

  SaveWeekResult result;
  WeekPlan       plan;
  plan.instructor_id  = request.instructor_id;
  plan.week_start     = week_start;
  plan.base_version   = request.override ? std::nullopt : request.base_version;
  plan.check_existing = !request.ignore_existing;
  plan.action         = action;
  plan.actor_id       = request.actor_id;

  for (const auto& [date, windows] : submitted) {
    const auto guard = GuardFor(date, today);
    if (guard != Guard::kNone) {
      CountSkip(guard, std::max(1, static_cast<int>(windows.size())), result.skipped);
      continue;
    }

    PlannedDay planned;
    planned.windows = windows;
    planned.bits    = bitmap::Encode(windows);
    // A listed day without windows clears that day.
    planned.replace = request.clear_existing || request.clear_dates.count(date) > 0 || windows.empty();
    plan.days.emplace(date, std::move(planned));
    ++result.days_written;
  }

  // Days that are cleared without being resubmitted.
  for (const auto& date : util::WeekDates(week_start)) {
    const bool explicit_clear = request.clear_dates.count(date) > 0;
    if (submitted.count(date) > 0 || (!request.clear_existing && !explicit_clear)) {
      continue;
    }
    const auto guard = GuardFor(date, today);
    if (guard != Guard::kNone) {
      if (explicit_clear) {
        CountSkip(guard, 1, result.skipped);
      }
      continue;
    }
    PlannedDay cleared;
    cleared.replace = true;
    plan.days.emplace(date, std::move(cleared));
  }

  if (result.skipped.past_forbidden > 0 || result.skipped.past_window > 0) {
    AVAILABILITY_LOG_INFO("past dates skipped", {StringField("instructor_id", request.instructor_id), DateField("week_start", week_start),
                                                 DateField("today", today), IntField("skipped_past_forbidden", result.skipped.past_forbidden),
                                                 IntField("skipped_past_window", result.skipped.past_window)});
  }

  bitmap::WeekBits bits;
  if (plan.days.empty()) {
    bits = GetWeekBits(request.instructor_id, week_start, false);
  } else {
    const auto commit   = CommitPlan(plan, today);
    result.rows_written = commit.rows_changed;
    bits                = commit.bits;
    RefreshCache(request.instructor_id, week_start, bits);
  }

  result.version = ComputeWeekVersion(bits);
  result.week    = ToWeekView(week_start, bits);

  AVAILABILITY_LOG_INFO("week saved", {StringField("instructor_id", request.instructor_id), DateField("week_start", week_start),
                                       StringField("action", action), IntField("days_written", result.days_written),
                                       IntField("rows_written", result.rows_written), StringField("version", result.version)});
  return result;
}

AvailabilityEngine::WeekCommit AvailabilityEngine::CommitPlan(const WeekPlan& plan, util::Date today) {
  WeekCommit commit;

  store::WeekWriteResult write_result;
  try {
    write_result = store_->MutateWeek(plan.instructor_id, plan.week_start, [&](const store::StoredWeek& current) {
      if (plan.base_version) {
        const auto current_version = ComputeWeekVersion(current.Bits());
        if (current_version != *plan.base_version) {
          observability::Metrics::Instance().RecordWriteConflict("version");
          AVAILABILITY_LOG_WARN("week version conflict", {StringField("instructor_id", plan.instructor_id),
                                                          DateField("week_start", plan.week_start), StringField("expected", *plan.base_version),
                                                          StringField("current", current_version)});
          throw util::VersionConflict("week " + util::FormatIsoDate(plan.week_start) + " changed since version " + *plan.base_version +
                                          "; refetch and retry",
                                      *plan.base_version, current_version);
        }
      }

      store::WeekWrite        write;
      std::vector<util::Date> affected;
      v1::WindowSnapshot      before_snapshot;
      v1::WindowSnapshot      after_snapshot;

      commit.bits = current.Bits();
      for (const auto& [date, planned] : plan.days) {
        const auto  index  = DayIndex(plan.week_start, date);
        const auto& before = current.days[index].bits;
        if (!planned.replace && plan.check_existing) {
          CheckPersisted(date, before, planned.windows);
        }

        const auto after  = planned.replace ? planned.bits : bitmap::Union(before, planned.bits);
        write.days[date]  = after;
        commit.bits[index] = after;
        if (after != before) {
          affected.push_back(date);
          AppendDay(before_snapshot, date, before);
          AppendDay(after_snapshot, date, after);
        }
      }

      if (affected.empty()) {
        return write;
      }

      const auto now_ms  = util::ToUnixMillis(util::Now());
      const auto version = ComputeWeekVersion(commit.bits);

      if (options_.audit_enabled) {
        db::model::AuditRecord audit;
        audit.id            = util::GenerateUUIDString();
        audit.instructor_id = plan.instructor_id;
        audit.actor_id      = plan.actor_id.empty() ? plan.instructor_id : plan.actor_id;
        audit.action        = plan.action;
        audit.target_date   = util::FormatIsoDate(affected.size() == 1 ? affected.front() : plan.week_start);
        audit.before_json   = ToJson(before_snapshot);
        audit.after_json    = ToJson(after_snapshot);
        audit.created_at_ms = now_ms;
        write.audit.push_back(std::move(audit));
      }

      const bool past_only = std::all_of(affected.begin(), affected.end(), [today](util::Date date) { return date < today; });
      if (options_.suppress_past_events && past_only) {
        AVAILABILITY_LOG_DEBUG("outbox event suppressed for past-only write",
                               {StringField("instructor_id", plan.instructor_id), DateField("week_start", plan.week_start)});
      } else {
        v1::WeekSavedEvent event;
        event.set_instructor_id(plan.instructor_id);
        event.set_week_start(util::FormatIsoDate(plan.week_start));
        for (const auto& date : affected) {
          event.add_affected_dates(util::FormatIsoDate(date));
        }
        event.set_version(version);

        db::model::OutboxRecord outbox;
        outbox.id            = util::GenerateUUIDString();
        outbox.event_type    = kWeekSavedEvent;
        outbox.aggregate_id  = plan.instructor_id + ":" + util::FormatIsoDate(plan.week_start);
        outbox.payload_json  = ToJson(event);
        outbox.created_at_ms = now_ms;
        write.outbox.push_back(std::move(outbox));
      }
      return write;
    });
  } catch (const util::VersionConflict& e) {
    if (!e.Current().empty()) {
      throw;
    }
    // Lost the commit race inside the backend; report the token that won.
    const auto current_version = ComputeWeekVersion(store_->GetWeek(plan.instructor_id, plan.week_start).Bits());
    observability::Metrics::Instance().RecordWriteConflict("version");
    AVAILABILITY_LOG_WARN("concurrent week commit", {StringField("instructor_id", plan.instructor_id), DateField("week_start", plan.week_start),
                                                     StringField("current", current_version)});
    throw util::VersionConflict(e.what(), plan.base_version.value_or(""), current_version);
  }

  commit.rows_changed = write_result.rows_changed;
  return commit;
}

WeekOperationResult AvailabilityEngine::CopyWeek(const std::string& instructor_id, util::Date from_week, util::Date to_week,
                                                 const std::string& actor_id) {
  RequireInstructor(instructor_id);
  RequireMonday(from_week, "from_week_start");
  RequireMonday(to_week, "to_week_start");
  if (from_week == to_week) {
    throw util::ValidationFailure("source and target week are both " + util::FormatIsoDate(from_week));
  }

  const auto source = GetWeekBits(instructor_id, from_week, false);
  const auto today  = clock_->Today(instructor_id);

  WeekOperationResult result;
  WeekPlan            plan;
  plan.instructor_id  = instructor_id;
  plan.week_start     = to_week;
  plan.check_existing = false;
  plan.action         = "copy_week";
  plan.actor_id       = actor_id;

  for (int i = 0; i < util::kDaysPerWeek; ++i) {
    const auto date  = to_week + std::chrono::days{i};
    const auto guard = GuardFor(date, today);
    if (guard != Guard::kNone) {
      CountSkip(guard, 1, result.skipped);
      continue;
    }
    PlannedDay planned;
    planned.bits    = source[static_cast<std::size_t>(i)];
    planned.replace = true;
    plan.days.emplace(date, std::move(planned));
    ++result.days_written;
  }

  if (!plan.days.empty()) {
    const auto commit = CommitPlan(plan, today);
    RefreshCache(instructor_id, to_week, commit.bits);
    result.weeks_written = 1;
  }

  AVAILABILITY_LOG_INFO("week copied", {StringField("instructor_id", instructor_id), DateField("from_week_start", from_week),
                                        DateField("to_week_start", to_week), IntField("days_written", result.days_written)});
  return result;
}

WeekOperationResult AvailabilityEngine::ApplyPatternToRange(const std::string& instructor_id, util::Date from_week, util::Date first,
                                                            util::Date last, const std::string& actor_id) {
  RequireInstructor(instructor_id);
  RequireMonday(from_week, "from_week_start");
  RequireRange(first, last);

  const auto source = GetWeekBits(instructor_id, from_week, false);
  const auto today  = clock_->Today(instructor_id);

  WeekOperationResult result;
  for (auto week = util::MondayOf(first); week <= last; week += std::chrono::days{util::kDaysPerWeek}) {
    WeekPlan plan;
    plan.instructor_id  = instructor_id;
    plan.week_start     = week;
    plan.check_existing = false;
    plan.action         = "apply_pattern";
    plan.actor_id       = actor_id;

    for (const auto& date : util::WeekDates(week)) {
      if (date < first || date > last) {
        continue;
      }
      const auto guard = GuardFor(date, today);
      if (guard != Guard::kNone) {
        CountSkip(guard, 1, result.skipped);
        continue;
      }
      // Weekdays without a pattern are cleared.
      PlannedDay planned;
      planned.bits    = source[static_cast<std::size_t>(util::WeekdayIndex(date))];
      planned.replace = true;
      plan.days.emplace(date, std::move(planned));
      ++result.days_written;
    }

    if (plan.days.empty()) {
      continue;
    }
    const auto commit = CommitPlan(plan, today);
    RefreshCache(instructor_id, week, commit.bits);
    ++result.weeks_written;
  }

  AVAILABILITY_LOG_INFO("pattern applied", {StringField("instructor_id", instructor_id), DateField("from_week_start", from_week),
                                            DateField("start_date", first), DateField("end_date", last),
                                            IntField("weeks_written", result.weeks_written), IntField("days_written", result.days_written)});
  return result;
}

std::optional<db::model::BlackoutRecord> AvailabilityEngine::AddBlackoutDate(const std::string& instructor_id, util::Date date,
                                                                             const std::string& reason) {
  RequireInstructor(instructor_id);

  const auto guard = GuardFor(date, clock_->Today(instructor_id));
  if (guard != Guard::kNone) {
    GuardrailSkips skipped;
    CountSkip(guard, 1, skipped);
    AVAILABILITY_LOG_INFO("blackout date skipped", {StringField("instructor_id", instructor_id), DateField("date", date)});
    return std::nullopt;
  }

  db::model::BlackoutRecord record;
  record.id            = util::GenerateUUIDString();
  record.instructor_id = instructor_id;
  record.day_date      = util::FormatIsoDate(date);
  record.reason        = reason;
  record.created_at_ms = util::ToUnixMillis(util::Now());

  std::optional<db::model::AuditRecord> audit;
  if (options_.audit_enabled) {
    v1::BlackoutDate after;
    after.set_id(record.id);
    after.set_instructor_id(record.instructor_id);
    after.set_date(record.day_date);
    after.set_reason(record.reason);
    after.set_created_at_ms(record.created_at_ms);

    audit.emplace();
    audit->id            = util::GenerateUUIDString();
    audit->instructor_id = instructor_id;
    audit->actor_id      = instructor_id;
    audit->action        = "add_blackout";
    audit->target_date   = record.day_date;
    audit->before_json   = "{}";
    audit->after_json    = ToJson(after);
    audit->created_at_ms = record.created_at_ms;
  }

  store_->AddBlackout(record, audit);
  AVAILABILITY_LOG_INFO("blackout date added", {StringField("instructor_id", instructor_id), DateField("date", date),
                                                StringField("blackout_id", record.id)});
  return record;
}

std::vector<db::model::BlackoutRecord> AvailabilityEngine::ListBlackoutDates(const std::string& instructor_id) const {
  RequireInstructor(instructor_id);
  return store_->ListBlackouts(instructor_id, clock_->Today(instructor_id));
}

void AvailabilityEngine::DeleteBlackoutDate(const std::string& instructor_id, const std::string& id) {
  RequireInstructor(instructor_id);
  if (id.empty()) {
    throw util::ValidationFailure("blackout id is required");
  }
  store_->DeleteBlackout(instructor_id, id);
  AVAILABILITY_LOG_INFO("blackout date deleted", {StringField("instructor_id", instructor_id), StringField("blackout_id", id)});
}

RetentionResult AvailabilityEngine::PurgeRetention(std::optional<bool> dry_run) {
  const auto& retention = options_.retention;
  if (!retention.enabled) {
    throw util::ValidationFailure("retention is disabled");
  }

  const auto today = clock_->Today("");

  RetentionResult result;
  result.dry_run     = dry_run.value_or(retention.dry_run);
  result.cutoff      = today - std::chrono::days{std::max(retention.retention_days, retention.keep_recent_days)};
  result.rows_purged = result.dry_run ? store_->CountBefore(result.cutoff) : store_->PurgeBefore(result.cutoff);

  AVAILABILITY_LOG_INFO("retention purge", {DateField("cutoff", result.cutoff), IntField("rows", static_cast<std::int64_t>(result.rows_purged)),
                                            observability::BoolField("dry_run", result.dry_run)});
  return result;
}

/*
  Helpers
*/

AvailabilityEngine::Guard AvailabilityEngine::GuardFor(util::Date date, util::Date today) const {
  switch (options_.past_edit_policy) {
    case PastEditPolicy::kForbid:
      return date < today ? Guard::kPastForbidden : Guard::kNone;
    case PastEditPolicy::kWindow:
      return date < today - std::chrono::days{options_.past_edit_window_days} ? Guard::kPastWindow : Guard::kNone;
    case PastEditPolicy::kAllow:
    default:
      return Guard::kNone;
  }
}

void AvailabilityEngine::CountSkip(Guard guard, int count, GuardrailSkips& skips) const {
  switch (guard) {
    case Guard::kPastForbidden:
      skips.past_forbidden += count;
      observability::Metrics::Instance().RecordGuardrailSkips("forbid", static_cast<std::uint64_t>(count));
      break;
    case Guard::kPastWindow:
      skips.past_window += count;
      observability::Metrics::Instance().RecordGuardrailSkips("window", static_cast<std::uint64_t>(count));
      break;
    case Guard::kNone:
      break;
  }
}

void AvailabilityEngine::StoreWeekInCache(const std::string& instructor_id, util::Date week_start, const bitmap::WeekBits& bits) const {
  for (int i = 0; i < util::kDaysPerWeek; ++i) {
    cache_.Set(cache::CacheNamespace::kDay, cache::DayKey(instructor_id, week_start + std::chrono::days{i}),
               bitmap::Pack(bits[static_cast<std::size_t>(i)]), options_.day_cache_ttl);
  }
  cache_.Set(cache::CacheNamespace::kWeek, cache::WeekKey(instructor_id, week_start), SerializeWeek(instructor_id, week_start, bits),
             options_.week_cache_ttl);
}

void AvailabilityEngine::RefreshCache(const std::string& instructor_id, util::Date week_start, const bitmap::WeekBits& computed) const {
  if (!cache_.Enabled()) {
    return;
  }

  cache_.Invalidate(cache::CacheNamespace::kWeek, cache::WeekKey(instructor_id, week_start));
  for (const auto& date : util::WeekDates(week_start)) {
    cache_.Invalidate(cache::CacheNamespace::kDay, cache::DayKey(instructor_id, date));
  }

  auto warm = computed;
  try {
    warm = store_->GetWeek(instructor_id, week_start).Bits();
  } catch (const std::exception& e) {
    AVAILABILITY_LOG_WARN("cache re-warm read failed; using computed week", {StringField("instructor_id", instructor_id),
                                                                             DateField("week_start", week_start), StringField("error", e.what())});
  }
  StoreWeekInCache(instructor_id, week_start, warm);
}

WeekView AvailabilityEngine::ToWeekView(util::Date week_start, const bitmap::WeekBits& bits) const {
  WeekView view;
  view.week_start = week_start;
  for (int i = 0; i < util::kDaysPerWeek; ++i) {
    auto& day   = view.days[static_cast<std::size_t>(i)];
    day.date    = week_start + std::chrono::days{i};
    day.windows = bitmap::Decode(bits[static_cast<std::size_t>(i)]);
  }
  view.version = ComputeWeekVersion(bits);
  return view;
}

} // namespace availability::core
