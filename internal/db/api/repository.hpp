#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/audit_record.hpp"
#include "internal/db/model/blackout_record.hpp"
#include "internal/db/model/day_record.hpp"
#include "internal/db/model/outbox_record.hpp"

namespace availability::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - A week write, its audit row and its outbox row commit together
  - Date arguments are ISO strings; ranges are inclusive

  The DB is the source of truth for:
    day bit vectors
    blackout dates
    audit and outbox records
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Serializes writers of one instructor week for the rest of the
  // transaction. No-op where Begin() already takes the write lock.
  virtual Result LockWeek(Transaction&, const std::string& instructor_id, const std::string& week_start) = 0;

  // ---------------------------------------------------------------------
  // Day rows
  // ---------------------------------------------------------------------

  virtual std::optional<model::DayRecord> GetDay(Transaction&, const std::string& instructor_id, const std::string& day_date) = 0;

  // Ordered by day_date.
  virtual std::vector<model::DayRecord> GetDays(Transaction&, const std::string& instructor_id, const std::string& first_date,
                                                const std::string& last_date) = 0;

  virtual Result UpsertDay(Transaction&, const model::DayRecord&) = 0;

  virtual Result DeleteDay(Transaction&, const std::string& instructor_id, const std::string& day_date) = 0;

  virtual uint64_t CountDaysBefore(Transaction&, const std::string& cutoff_date) = 0;

  virtual Result DeleteDaysBefore(Transaction&, const std::string& cutoff_date, uint64_t& deleted) = 0;

  // ---------------------------------------------------------------------
  // Blackout dates
  // ---------------------------------------------------------------------

  // AlreadyExists when the instructor already has a blackout on that date.
  virtual Result InsertBlackout(Transaction&, const model::BlackoutRecord&) = 0;

  // Blackouts on or after from_date, ordered by date.
  virtual std::vector<model::BlackoutRecord> ListBlackouts(Transaction&, const std::string& instructor_id, const std::string& from_date) = 0;

  // NotFound when no blackout with that id belongs to the instructor.
  virtual Result DeleteBlackout(Transaction&, const std::string& instructor_id, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Audit / outbox (append-only)
  // ---------------------------------------------------------------------

  virtual Result InsertAudit(Transaction&, const model::AuditRecord&) = 0;

  virtual std::vector<model::AuditRecord> ListAudit(Transaction&, const std::string& instructor_id) = 0;

  virtual Result InsertOutbox(Transaction&, const model::OutboxRecord&) = 0;

  virtual std::vector<model::OutboxRecord> ListOutbox(Transaction&) = 0;
};

} // namespace availability::db
