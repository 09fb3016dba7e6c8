#include "pg_repository.hpp"

#include <stdexcept>

namespace availability::db::postgres {

namespace {

std::string ToHex(const std::string& bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(bytes.size() * 2);
  for (unsigned char b : bytes) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

std::string FromHex(std::string_view hex) {
  if (hex.size() % 2 != 0) {
    throw std::runtime_error("corrupt bytea hex payload");
  }
  std::string out(hex.size() / 2, '\0');
  for (std::size_t i = 0; i < out.size(); ++i) {
    const int hi = HexNibble(hex[2 * i]);
    const int lo = HexNibble(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      throw std::runtime_error("corrupt bytea hex payload");
    }
    out[i] = static_cast<char>((hi << 4) | lo);
  }
  return out;
}

model::DayRecord ReadDay(const pqxx::row& row) {
  model::DayRecord r;
  r.instructor_id = row[0].c_str();
  r.day_date      = row[1].c_str();
  r.bits          = FromHex(row[2].c_str());
  r.updated_at_ms = row[3].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::LockWeek(Transaction& t, const std::string& instructor_id, const std::string& week_start) {
  try {
    TX(t).Work().exec_prepared("lock_week", instructor_id + "/" + week_start);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Day rows
// ------------------------------------------------------------------

std::optional<model::DayRecord> PgRepository::GetDay(Transaction& t, const std::string& instructor_id, const std::string& day_date) {
  auto res = TX(t).Work().exec_prepared("get_day", instructor_id, day_date);
  if (res.empty()) return std::nullopt;
  return ReadDay(res[0]);
}

std::vector<model::DayRecord> PgRepository::GetDays(Transaction& t, const std::string& instructor_id, const std::string& first_date,
                                                    const std::string& last_date) {
  auto res = TX(t).Work().exec_prepared("get_days", instructor_id, first_date, last_date);

  std::vector<model::DayRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadDay(row));
  }
  return out;
}

Result PgRepository::UpsertDay(Transaction& t, const model::DayRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_day", r.instructor_id, r.day_date, ToHex(r.bits), r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteDay(Transaction& t, const std::string& instructor_id, const std::string& day_date) {
  try {
    TX(t).Work().exec_prepared("delete_day", instructor_id, day_date);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

uint64_t PgRepository::CountDaysBefore(Transaction& t, const std::string& cutoff_date) {
  auto res = TX(t).Work().exec_params("SELECT COUNT(*) FROM availability_days WHERE day_date<$1;", cutoff_date);
  return res.empty() ? 0 : res[0][0].as<uint64_t>();
}

Result PgRepository::DeleteDaysBefore(Transaction& t, const std::string& cutoff_date, uint64_t& deleted) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM availability_days WHERE day_date<$1;", cutoff_date);
    deleted  = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    deleted = 0;
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Blackout dates
// ------------------------------------------------------------------

Result PgRepository::InsertBlackout(Transaction& t, const model::BlackoutRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_blackout", r.id, r.instructor_id, r.day_date, r.reason, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::BlackoutRecord> PgRepository::ListBlackouts(Transaction& t, const std::string& instructor_id, const std::string& from_date) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,instructor_id,day_date,reason,created_at_ms FROM blackout_dates WHERE instructor_id=$1 AND day_date>=$2 ORDER BY day_date;",
      instructor_id, from_date);

  std::vector<model::BlackoutRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::BlackoutRecord r;
    r.id            = row[0].c_str();
    r.instructor_id = row[1].c_str();
    r.day_date      = row[2].c_str();
    r.reason        = row[3].is_null() ? "" : row[3].c_str();
    r.created_at_ms = row[4].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::DeleteBlackout(Transaction& t, const std::string& instructor_id, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM blackout_dates WHERE instructor_id=$1 AND id=$2;", instructor_id, id);
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Audit / outbox
// ------------------------------------------------------------------

Result PgRepository::InsertAudit(Transaction& t, const model::AuditRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_audit", r.id, r.instructor_id, r.actor_id, r.action, r.target_date, r.before_json, r.after_json,
                               r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::AuditRecord> PgRepository::ListAudit(Transaction& t, const std::string& instructor_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,instructor_id,actor_id,action,target_date,before_json::text,after_json::text,created_at_ms "
      "FROM availability_audit WHERE instructor_id=$1 ORDER BY seq;",
      instructor_id);

  std::vector<model::AuditRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::AuditRecord r;
    r.id            = row[0].c_str();
    r.instructor_id = row[1].c_str();
    r.actor_id      = row[2].is_null() ? "" : row[2].c_str();
    r.action        = row[3].c_str();
    r.target_date   = row[4].c_str();
    r.before_json   = row[5].is_null() ? "" : row[5].c_str();
    r.after_json    = row[6].is_null() ? "" : row[6].c_str();
    r.created_at_ms = row[7].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::InsertOutbox(Transaction& t, const model::OutboxRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_outbox", r.id, r.event_type, r.aggregate_id, r.payload_json, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::OutboxRecord> PgRepository::ListOutbox(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT id,event_type,aggregate_id,payload_json::text,created_at_ms FROM availability_outbox ORDER BY seq;");

  std::vector<model::OutboxRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::OutboxRecord r;
    r.id            = row[0].c_str();
    r.event_type    = row[1].c_str();
    r.aggregate_id  = row[2].c_str();
    r.payload_json  = row[3].c_str();
    r.created_at_ms = row[4].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace availability::db::postgres
