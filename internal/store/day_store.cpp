#include "day_store.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace availability::store {

namespace {

void ThrowIfError(const db::Result& result, const std::string& what) {
  if (result) {
    return;
  }
  throw std::runtime_error(what + " failed: " + (result.message.empty() ? "storage error" : result.message));
}

StoredDay ToStoredDay(const db::model::DayRecord& record) {
  StoredDay day;
  day.date          = util::ParseIsoDate(record.day_date);
  day.bits          = bitmap::Unpack(record.bits);
  day.updated_at_ms = record.updated_at_ms;
  day.present       = true;
  return day;
}

StoredWeek ReadWeek(db::Repository& repository, db::Transaction& tx, const std::string& instructor_id, util::Date week_start) {
  StoredWeek week;
  week.week_start = week_start;
  for (int i = 0; i < util::kDaysPerWeek; ++i) {
    week.days[static_cast<std::size_t>(i)].date = week_start + std::chrono::days{i};
  }

  const auto rows = repository.GetDays(tx, instructor_id, util::FormatIsoDate(week_start),
                                       util::FormatIsoDate(week_start + std::chrono::days{util::kDaysPerWeek - 1}));
  for (const auto& row : rows) {
    auto      day   = ToStoredDay(row);
    const int index = static_cast<int>((day.date - week_start).count());
    if (index >= 0 && index < util::kDaysPerWeek) {
      week.days[static_cast<std::size_t>(index)] = day;
    }
  }
  return week;
}

// Writes only the rows whose bits differ from `current`.
int WriteDays(db::Repository& repository, db::Transaction& tx, const std::string& instructor_id, const StoredWeek& current,
              const std::map<util::Date, bitmap::DayBits>& days, uint64_t now_ms) {
  int changed = 0;
  for (const auto& [date, bits] : days) {
    const auto offset = (date - current.week_start).count();
    if (offset < 0 || offset >= util::kDaysPerWeek) {
      throw std::invalid_argument("day " + util::FormatIsoDate(date) + " is outside week " + util::FormatIsoDate(current.week_start));
    }

    const auto& before = current.days[static_cast<std::size_t>(offset)];
    if (before.present == bits.any() && before.bits == bits) {
      continue;
    }

    const auto date_text = util::FormatIsoDate(date);
    if (bits.none()) {
      ThrowIfError(repository.DeleteDay(tx, instructor_id, date_text), "delete day " + date_text);
    } else {
      db::model::DayRecord record;
      record.instructor_id = instructor_id;
      record.day_date      = date_text;
      record.bits          = bitmap::Pack(bits);
      record.updated_at_ms = now_ms;
      ThrowIfError(repository.UpsertDay(tx, record), "upsert day " + date_text);
    }
    ++changed;
  }
  return changed;
}

void CommitOrConflict(db::Transaction& tx, const std::string& instructor_id, util::Date week_start) {
  try {
    tx.Commit();
  } catch (const db::TransactionConflict& e) {
    throw util::VersionConflict("week " + util::FormatIsoDate(week_start) + " of " + instructor_id +
                                    " was modified concurrently (" + e.what() + "); refetch and retry",
                                "", "");
  }
}

} // namespace

bitmap::WeekBits StoredWeek::Bits() const {
  bitmap::WeekBits bits;
  for (std::size_t i = 0; i < days.size(); ++i) {
    bits[i] = days[i].bits;
  }
  return bits;
}

std::optional<uint64_t> StoredWeek::LastModifiedMs() const {
  std::optional<uint64_t> latest;
  for (const auto& day : days) {
    if (day.present && (!latest || day.updated_at_ms > *latest)) {
      latest = day.updated_at_ms;
    }
  }
  return latest;
}

DayStore::DayStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("DayStore requires a repository");
  }
}

std::optional<StoredDay> DayStore::GetDay(const std::string& instructor_id, util::Date date) const {
  auto tx  = repository_->Begin();
  auto row = repository_->GetDay(*tx, instructor_id, util::FormatIsoDate(date));
  tx->Commit();
  if (!row) {
    return std::nullopt;
  }
  return ToStoredDay(*row);
}

StoredWeek DayStore::GetWeek(const std::string& instructor_id, util::Date week_start) const {
  auto tx   = repository_->Begin();
  auto week = ReadWeek(*repository_, *tx, instructor_id, week_start);
  tx->Commit();
  return week;
}

std::vector<StoredDay> DayStore::GetRange(const std::string& instructor_id, util::Date first, util::Date last) const {
  auto       tx   = repository_->Begin();
  const auto rows = repository_->GetDays(*tx, instructor_id, util::FormatIsoDate(first), util::FormatIsoDate(last));
  tx->Commit();

  std::vector<StoredDay> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    out.push_back(ToStoredDay(row));
  }
  return out;
}

WeekWriteResult DayStore::UpsertWeek(const std::string& instructor_id, util::Date week_start, const std::map<util::Date, bitmap::DayBits>& days) {
  return MutateWeek(instructor_id, week_start, [&days](const StoredWeek&) {
    WeekWrite write;
    write.days = days;
    return write;
  });
}

WeekWriteResult DayStore::MutateWeek(const std::string& instructor_id, util::Date week_start, const WeekMutation& mutation) {
  auto tx = repository_->Begin();
  ThrowIfError(repository_->LockWeek(*tx, instructor_id, util::FormatIsoDate(week_start)), "lock week");

  const auto current = ReadWeek(*repository_, *tx, instructor_id, week_start);
  const auto write   = mutation(current);

  WeekWriteResult result;
  result.updated_at_ms = util::ToUnixMillis(util::Now());
  result.rows_changed  = WriteDays(*repository_, *tx, instructor_id, current, write.days, result.updated_at_ms);

  for (const auto& audit : write.audit) {
    ThrowIfError(repository_->InsertAudit(*tx, audit), "insert audit");
  }
  for (const auto& event : write.outbox) {
    ThrowIfError(repository_->InsertOutbox(*tx, event), "insert outbox");
  }

  CommitOrConflict(*tx, instructor_id, week_start);
  return result;
}

void DayStore::ClearWeek(const std::string& instructor_id, util::Date week_start) {
  std::map<util::Date, bitmap::DayBits> empty;
  for (const auto& date : util::WeekDates(week_start)) {
    empty[date] = bitmap::DayBits{};
  }
  UpsertWeek(instructor_id, week_start, empty);
}

uint64_t DayStore::CountBefore(util::Date cutoff) const {
  auto       tx    = repository_->Begin();
  const auto count = repository_->CountDaysBefore(*tx, util::FormatIsoDate(cutoff));
  tx->Commit();
  return count;
}

uint64_t DayStore::PurgeBefore(util::Date cutoff) {
  auto     tx      = repository_->Begin();
  uint64_t deleted = 0;
  ThrowIfError(repository_->DeleteDaysBefore(*tx, util::FormatIsoDate(cutoff), deleted), "purge days");
  tx->Commit();
  return deleted;
}

void DayStore::AddBlackout(const db::model::BlackoutRecord& record, const std::optional<db::model::AuditRecord>& audit) {
  auto       tx     = repository_->Begin();
  const auto result = repository_->InsertBlackout(*tx, record);
  if (result.code == db::ErrorCode::AlreadyExists) {
    throw util::AlreadyExists("blackout already exists for " + record.instructor_id + " on " + record.day_date);
  }
  ThrowIfError(result, "insert blackout");
  if (audit) {
    ThrowIfError(repository_->InsertAudit(*tx, *audit), "insert audit");
  }
  tx->Commit();
}

std::vector<db::model::BlackoutRecord> DayStore::ListBlackouts(const std::string& instructor_id, util::Date from) const {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListBlackouts(*tx, instructor_id, util::FormatIsoDate(from));
  tx->Commit();
  return rows;
}

void DayStore::DeleteBlackout(const std::string& instructor_id, const std::string& id) {
  auto       tx     = repository_->Begin();
  const auto result = repository_->DeleteBlackout(*tx, instructor_id, id);
  if (result.code == db::ErrorCode::NotFound) {
    throw util::NotFound("blackout " + id + " not found for " + instructor_id);
  }
  ThrowIfError(result, "delete blackout");
  tx->Commit();
}

std::vector<db::model::AuditRecord> DayStore::ListAudit(const std::string& instructor_id) const {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListAudit(*tx, instructor_id);
  tx->Commit();
  return rows;
}

std::vector<db::model::OutboxRecord> DayStore::ListOutbox() const {
  auto tx   = repository_->Begin();
  auto rows = repository_->ListOutbox(*tx);
  tx->Commit();
  return rows;
}

} // namespace availability::store
