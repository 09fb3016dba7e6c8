#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace availability::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result LockWeek(Transaction&, const std::string& instructor_id, const std::string& week_start) override;

  std::optional<model::DayRecord> GetDay(Transaction&, const std::string& instructor_id,
                                         const std::string& day_date) override;
  std::vector<model::DayRecord> GetDays(Transaction&, const std::string& instructor_id,
                                        const std::string& first_date, const std::string& last_date) override;
  Result UpsertDay(Transaction&, const model::DayRecord&) override;
  Result DeleteDay(Transaction&, const std::string& instructor_id, const std::string& day_date) override;
  uint64_t CountDaysBefore(Transaction&, const std::string& cutoff_date) override;
  Result DeleteDaysBefore(Transaction&, const std::string& cutoff_date, uint64_t& deleted) override;

  Result InsertBlackout(Transaction&, const model::BlackoutRecord&) override;
  std::vector<model::BlackoutRecord> ListBlackouts(Transaction&, const std::string& instructor_id,
                                                   const std::string& from_date) override;
  Result DeleteBlackout(Transaction&, const std::string& instructor_id, const std::string& id) override;

  Result InsertAudit(Transaction&, const model::AuditRecord&) override;
  std::vector<model::AuditRecord> ListAudit(Transaction&, const std::string& instructor_id) override;
  Result InsertOutbox(Transaction&, const model::OutboxRecord&) override;
  std::vector<model::OutboxRecord> ListOutbox(Transaction&) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
