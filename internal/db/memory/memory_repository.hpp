#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace availability::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  // (instructor_id, day_date); ordered so week and range scans are slices.
  using DayKey = std::pair<std::string, std::string>;

  struct State {
    std::map<DayKey, model::DayRecord> days;
    std::unordered_map<std::string, model::BlackoutRecord> blackouts;
    std::vector<model::AuditRecord> audit;
    std::vector<model::OutboxRecord> outbox;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
  // Conflict key -> committed_version_ of the last commit that touched it.
  std::unordered_map<std::string, uint64_t> key_versions_;
};

}
