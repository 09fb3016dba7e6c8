#include "sqlite_repository.hpp"

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace availability::db::sqlite {

using availability::db::ErrorCode;
using availability::db::Result;

namespace {

// Reads have no Result channel; a failed read is a storage error.
void ThrowOnReadError(sqlite3* db, int rc, const char* what) {
  if (rc != SQLITE_OK && rc != SQLITE_ROW && rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite ") + what + ": " + sqlite3_errmsg(db));
  }
}

model::DayRecord ReadDay(const Statement& st) {
  model::DayRecord r;
  r.instructor_id = st.ColText(0);
  r.day_date      = st.ColText(1);
  r.bits          = st.ColBlob(2);
  r.updated_at_ms = st.ColU64(3);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

Result SqliteRepository::LockWeek(Transaction&, const std::string&, const std::string&) {
    // BEGIN IMMEDIATE already holds the database write lock.
    return Result::Ok();
}

// ------------------------------------------------------------------
// Day rows
// ------------------------------------------------------------------

std::optional<model::DayRecord>
SqliteRepository::GetDay(Transaction& t, const std::string& instructor_id, const std::string& day_date) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_DAY);
    ThrowOnReadError(db, st.PrepareCode(), "prepare");

    st.BindText(1, instructor_id);
    st.BindText(2, day_date);

    int rc = st.Step();
    ThrowOnReadError(db, rc, "step");
    if (rc != SQLITE_ROW) return std::nullopt;
    return ReadDay(st);
}

std::vector<model::DayRecord>
SqliteRepository::GetDays(Transaction& t, const std::string& instructor_id, const std::string& first_date, const std::string& last_date) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_DAYS);
    ThrowOnReadError(db, st.PrepareCode(), "prepare");

    st.BindText(1, instructor_id);
    st.BindText(2, first_date);
    st.BindText(3, last_date);

    std::vector<model::DayRecord> out;
    int rc = 0;
    while ((rc = st.Step()) == SQLITE_ROW) {
        out.push_back(ReadDay(st));
    }
    ThrowOnReadError(db, rc, "step");
    return out;
}

Result SqliteRepository::UpsertDay(Transaction& t, const model::DayRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::UPSERT_DAY);
    if (!st.Valid()) return Translate(db, st.PrepareCode());

    st.BindText(1, r.instructor_id);
    st.BindText(2, r.day_date);
    st.BindBlob(3, r.bits);
    st.BindU64(4, r.updated_at_ms);

    return Translate(db, st.Step());
}

Result SqliteRepository::DeleteDay(Transaction& t, const std::string& instructor_id, const std::string& day_date) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::DELETE_DAY);
    if (!st.Valid()) return Translate(db, st.PrepareCode());

    st.BindText(1, instructor_id);
    st.BindText(2, day_date);

    return Translate(db, st.Step());
}

uint64_t SqliteRepository::CountDaysBefore(Transaction& t, const std::string& cutoff_date) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::COUNT_DAYS_BEFORE);
    ThrowOnReadError(db, st.PrepareCode(), "prepare");
    st.BindText(1, cutoff_date);

    int rc = st.Step();
    ThrowOnReadError(db, rc, "step");
    return rc == SQLITE_ROW ? st.ColU64(0) : 0;
}

Result SqliteRepository::DeleteDaysBefore(Transaction& t, const std::string& cutoff_date, uint64_t& deleted) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::DELETE_DAYS_BEFORE);
    if (!st.Valid()) return Translate(db, st.PrepareCode());
    st.BindText(1, cutoff_date);

    auto result = Translate(db, st.Step());
    deleted     = result ? static_cast<uint64_t>(sqlite3_changes(db)) : 0;
    return result;
}

// ------------------------------------------------------------------
// Blackout dates
// ------------------------------------------------------------------

Result SqliteRepository::InsertBlackout(Transaction& t, const model::BlackoutRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_BLACKOUT);
    if (!st.Valid()) return Translate(db, st.PrepareCode());

    st.BindText(1, r.id);
    st.BindText(2, r.instructor_id);
    st.BindText(3, r.day_date);
    st.BindText(4, r.reason);
    st.BindU64(5, r.created_at_ms);

    auto result = Translate(db, st.Step());
    if (result.code == ErrorCode::ConstraintViolation) {
        return Result::Err(ErrorCode::AlreadyExists, result.message);
    }
    return result;
}

std::vector<model::BlackoutRecord>
SqliteRepository::ListBlackouts(Transaction& t, const std::string& instructor_id, const std::string& from_date) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_BLACKOUTS);
    ThrowOnReadError(db, st.PrepareCode(), "prepare");
    st.BindText(1, instructor_id);
    st.BindText(2, from_date);

    std::vector<model::BlackoutRecord> out;
    int rc = 0;
    while ((rc = st.Step()) == SQLITE_ROW) {
        model::BlackoutRecord r;
        r.id            = st.ColText(0);
        r.instructor_id = st.ColText(1);
        r.day_date      = st.ColText(2);
        r.reason        = st.ColText(3);
        r.created_at_ms = st.ColU64(4);
        out.push_back(std::move(r));
    }
    ThrowOnReadError(db, rc, "step");
    return out;
}

Result SqliteRepository::DeleteBlackout(Transaction& t, const std::string& instructor_id, const std::string& id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::DELETE_BLACKOUT);
    if (!st.Valid()) return Translate(db, st.PrepareCode());
    st.BindText(1, instructor_id);
    st.BindText(2, id);

    auto result = Translate(db, st.Step());
    if (result && sqlite3_changes(db) == 0) {
        return Result::Err(ErrorCode::NotFound);
    }
    return result;
}

// ------------------------------------------------------------------
// Audit / outbox
// ------------------------------------------------------------------

Result SqliteRepository::InsertAudit(Transaction& t, const model::AuditRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_AUDIT);
    if (!st.Valid()) return Translate(db, st.PrepareCode());

    st.BindText(1, r.id);
    st.BindText(2, r.instructor_id);
    st.BindText(3, r.actor_id);
    st.BindText(4, r.action);
    st.BindText(5, r.target_date);
    st.BindText(6, r.before_json);
    st.BindText(7, r.after_json);
    st.BindU64(8, r.created_at_ms);

    return Translate(db, st.Step());
}

std::vector<model::AuditRecord> SqliteRepository::ListAudit(Transaction& t, const std::string& instructor_id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_AUDIT);
    ThrowOnReadError(db, st.PrepareCode(), "prepare");
    st.BindText(1, instructor_id);

    std::vector<model::AuditRecord> out;
    int rc = 0;
    while ((rc = st.Step()) == SQLITE_ROW) {
        model::AuditRecord r;
        r.id            = st.ColText(0);
        r.instructor_id = st.ColText(1);
        r.actor_id      = st.ColText(2);
        r.action        = st.ColText(3);
        r.target_date   = st.ColText(4);
        r.before_json   = st.ColText(5);
        r.after_json    = st.ColText(6);
        r.created_at_ms = st.ColU64(7);
        out.push_back(std::move(r));
    }
    ThrowOnReadError(db, rc, "step");
    return out;
}

Result SqliteRepository::InsertOutbox(Transaction& t, const model::OutboxRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_OUTBOX);
    if (!st.Valid()) return Translate(db, st.PrepareCode());

    st.BindText(1, r.id);
    st.BindText(2, r.event_type);
    st.BindText(3, r.aggregate_id);
    st.BindText(4, r.payload_json);
    st.BindU64(5, r.created_at_ms);

    return Translate(db, st.Step());
}

std::vector<model::OutboxRecord> SqliteRepository::ListOutbox(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_OUTBOX);
    ThrowOnReadError(db, st.PrepareCode(), "prepare");

    std::vector<model::OutboxRecord> out;
    int rc = 0;
    while ((rc = st.Step()) == SQLITE_ROW) {
        model::OutboxRecord r;
        r.id            = st.ColText(0);
        r.event_type    = st.ColText(1);
        r.aggregate_id  = st.ColText(2);
        r.payload_json  = st.ColText(3);
        r.created_at_ms = st.ColU64(4);
        out.push_back(std::move(r));
    }
    ThrowOnReadError(db, rc, "step");
    return out;
}

} // namespace availability::db::sqlite
