#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace availability::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

static std::string WeekKey(const std::string& instructor_id, const std::string& week_start) {
  return "week/" + instructor_id + "/" + week_start;
}

static std::string DayKeyOf(const std::string& instructor_id, const std::string& day_date) {
  return "day/" + instructor_id + "/" + day_date;
}

static std::string BlackoutDateKey(const std::string& instructor_id, const std::string& day_date) {
  return "blackout/" + instructor_id + "/" + day_date;
}

static std::string BlackoutIdKey(const std::string& id) {
  return "blackout-id/" + id;
}

Result MemoryRepository::LockWeek(Transaction& t, const std::string& instructor_id, const std::string& week_start) {
  // Two writers of the same week both claim this key; the later commit loses.
  TX(t).Touch(WeekKey(instructor_id, week_start));
  return Result::Ok();
}

// ------------------------------------------------------------------
// Day rows
// ------------------------------------------------------------------

std::optional<model::DayRecord> MemoryRepository::GetDay(Transaction& t, const std::string& instructor_id, const std::string& day_date) {
  const auto& s  = TX(t).View();
  auto        it = s.days.find({instructor_id, day_date});
  if (it == s.days.end()) return std::nullopt;
  return it->second;
}

std::vector<model::DayRecord> MemoryRepository::GetDays(Transaction& t, const std::string& instructor_id, const std::string& first_date,
                                                        const std::string& last_date) {
  const auto&                   s = TX(t).View();
  std::vector<model::DayRecord> out;
  for (auto it = s.days.lower_bound({instructor_id, first_date}); it != s.days.end(); ++it) {
    if (it->first.first != instructor_id || it->first.second > last_date) break;
    out.push_back(it->second);
  }
  return out;
}

Result MemoryRepository::UpsertDay(Transaction& t, const model::DayRecord& r) {
  TX(t).Apply({DayKeyOf(r.instructor_id, r.day_date)}, [r](State& s) { s.days[{r.instructor_id, r.day_date}] = r; });
  return Result::Ok();
}

Result MemoryRepository::DeleteDay(Transaction& t, const std::string& instructor_id, const std::string& day_date) {
  TX(t).Apply({DayKeyOf(instructor_id, day_date)}, [key = DayKey{instructor_id, day_date}](State& s) { s.days.erase(key); });
  return Result::Ok();
}

uint64_t MemoryRepository::CountDaysBefore(Transaction& t, const std::string& cutoff_date) {
  const auto& s = TX(t).View();
  return static_cast<uint64_t>(
      std::count_if(s.days.begin(), s.days.end(), [&](const auto& entry) { return entry.first.second < cutoff_date; }));
}

Result MemoryRepository::DeleteDaysBefore(Transaction& t, const std::string& cutoff_date, uint64_t& deleted) {
  std::vector<std::string> keys;
  for (const auto& [key, _] : TX(t).View().days) {
    if (key.second < cutoff_date) keys.push_back(DayKeyOf(key.first, key.second));
  }
  deleted = keys.size();
  TX(t).Apply(std::move(keys), [cutoff_date](State& s) {
    std::erase_if(s.days, [&](const auto& entry) { return entry.first.second < cutoff_date; });
  });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Blackout dates
// ------------------------------------------------------------------

Result MemoryRepository::InsertBlackout(Transaction& t, const model::BlackoutRecord& r) {
  const auto& s = TX(t).View();
  if (s.blackouts.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "blackout id exists");
  for (const auto& [_, existing] : s.blackouts) {
    if (existing.instructor_id == r.instructor_id && existing.day_date == r.day_date) {
      return Result::Err(ErrorCode::AlreadyExists, "blackout date exists");
    }
  }
  TX(t).Apply({BlackoutIdKey(r.id), BlackoutDateKey(r.instructor_id, r.day_date)}, [r](State& state) { state.blackouts[r.id] = r; });
  return Result::Ok();
}

std::vector<model::BlackoutRecord> MemoryRepository::ListBlackouts(Transaction& t, const std::string& instructor_id, const std::string& from_date) {
  std::vector<model::BlackoutRecord> out;
  for (const auto& [_, r] : TX(t).View().blackouts)
    if (r.instructor_id == instructor_id && r.day_date >= from_date) out.push_back(r);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.day_date < b.day_date; });
  return out;
}

Result MemoryRepository::DeleteBlackout(Transaction& t, const std::string& instructor_id, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.blackouts.find(id);
  if (it == s.blackouts.end() || it->second.instructor_id != instructor_id) return Result::Err(ErrorCode::NotFound);
  TX(t).Apply({BlackoutIdKey(id), BlackoutDateKey(instructor_id, it->second.day_date)}, [id](State& state) { state.blackouts.erase(id); });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Audit / outbox
// ------------------------------------------------------------------

Result MemoryRepository::InsertAudit(Transaction& t, const model::AuditRecord& r) {
  TX(t).Apply({}, [r](State& s) { s.audit.push_back(r); });
  return Result::Ok();
}

std::vector<model::AuditRecord> MemoryRepository::ListAudit(Transaction& t, const std::string& instructor_id) {
  std::vector<model::AuditRecord> out;
  for (const auto& r : TX(t).View().audit)
    if (r.instructor_id == instructor_id) out.push_back(r);
  return out;
}

Result MemoryRepository::InsertOutbox(Transaction& t, const model::OutboxRecord& r) {
  TX(t).Apply({}, [r](State& s) { s.outbox.push_back(r); });
  return Result::Ok();
}

std::vector<model::OutboxRecord> MemoryRepository::ListOutbox(Transaction& t) {
  return TX(t).View().outbox;
}

} // namespace availability::db::memory
