#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/bitmap/bit_codec.hpp"
#include "internal/db/model/audit_record.hpp"
#include "internal/db/model/blackout_record.hpp"
#include "internal/db/model/outbox_record.hpp"
#include "internal/util/date.hpp"

namespace availability::db {
class Repository;
}

namespace availability::store {

struct StoredDay {
  util::Date      date{};
  bitmap::DayBits bits;
  // Zero when no row exists.
  uint64_t        updated_at_ms = 0;
  bool            present       = false;
};

struct StoredWeek {
  util::Date                               week_start{};
  std::array<StoredDay, util::kDaysPerWeek> days;

  bitmap::WeekBits        Bits() const;
  std::optional<uint64_t> LastModifiedMs() const;
};

/*
  Everything one week write commits together. A day mapped to empty bits
  deletes its row (absence means unavailable).
*/
struct WeekWrite {
  std::map<util::Date, bitmap::DayBits> days;
  std::vector<db::model::AuditRecord>   audit;
  std::vector<db::model::OutboxRecord>  outbox;
};

struct WeekWriteResult {
  // Rows whose stored bits actually changed (inserted, updated or deleted).
  int      rows_changed  = 0;
  uint64_t updated_at_ms = 0;
};

/*
  DayStore

  Mechanical persistence of one bit vector per (instructor, date) on top of
  db::Repository. No business validation lives here.

  Every call runs in its own repository transaction. Non-OK repository
  results become std::runtime_error; a lost commit race becomes
  util::VersionConflict.
*/
class DayStore {
 public:
  explicit DayStore(std::shared_ptr<db::Repository> repository);

  std::optional<StoredDay> GetDay(const std::string& instructor_id, util::Date date) const;

  // Always seven days, Monday first; missing rows are empty.
  StoredWeek GetWeek(const std::string& instructor_id, util::Date week_start) const;

  // Rows that exist in [first, last], ordered by date.
  std::vector<StoredDay> GetRange(const std::string& instructor_id, util::Date first, util::Date last) const;

  WeekWriteResult UpsertWeek(const std::string& instructor_id, util::Date week_start,
                             const std::map<util::Date, bitmap::DayBits>& days);

  using WeekMutation = std::function<WeekWrite(const StoredWeek& current)>;

  // Reads the week, applies `mutation` and writes its result in one
  // transaction. An exception from `mutation` leaves no effect.
  WeekWriteResult MutateWeek(const std::string& instructor_id, util::Date week_start, const WeekMutation& mutation);

  // Deletes every row of the week.
  void ClearWeek(const std::string& instructor_id, util::Date week_start);

  // Retention.
  uint64_t CountBefore(util::Date cutoff) const;
  uint64_t PurgeBefore(util::Date cutoff);

  // Blackout dates. Throws util::AlreadyExists / util::NotFound.
  void AddBlackout(const db::model::BlackoutRecord& record, const std::optional<db::model::AuditRecord>& audit);
  std::vector<db::model::BlackoutRecord> ListBlackouts(const std::string& instructor_id, util::Date from) const;
  void DeleteBlackout(const std::string& instructor_id, const std::string& id);

  std::vector<db::model::AuditRecord>  ListAudit(const std::string& instructor_id) const;
  std::vector<db::model::OutboxRecord> ListOutbox() const;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace availability::store
