#pragma once

namespace availability::db::sql {

/*
  Canonical SQL for the SQLite backend.

  Postgres prepares the same statements with $n placeholders and
  bytea hex conversion in pg_pool.cpp.
*/

// day rows

static constexpr const char* SELECT_DAY =
    "SELECT instructor_id,day_date,bits,updated_at_ms"
    " FROM availability_days WHERE instructor_id=? AND day_date=?;";

static constexpr const char* SELECT_DAYS =
    "SELECT instructor_id,day_date,bits,updated_at_ms"
    " FROM availability_days WHERE instructor_id=? AND day_date>=? AND day_date<=?"
    " ORDER BY day_date;";

static constexpr const char* UPSERT_DAY =
    "INSERT INTO availability_days(instructor_id,day_date,bits,updated_at_ms)"
    " VALUES(?,?,?,?)"
    " ON CONFLICT(instructor_id,day_date) DO UPDATE SET"
    " bits=excluded.bits,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* DELETE_DAY =
    "DELETE FROM availability_days WHERE instructor_id=? AND day_date=?;";

static constexpr const char* COUNT_DAYS_BEFORE =
    "SELECT COUNT(*) FROM availability_days WHERE day_date<?;";

static constexpr const char* DELETE_DAYS_BEFORE =
    "DELETE FROM availability_days WHERE day_date<?;";

// blackout dates

static constexpr const char* INSERT_BLACKOUT =
    "INSERT INTO blackout_dates(id,instructor_id,day_date,reason,created_at_ms)"
    " VALUES(?,?,?,?,?);";

static constexpr const char* SELECT_BLACKOUTS =
    "SELECT id,instructor_id,day_date,reason,created_at_ms"
    " FROM blackout_dates WHERE instructor_id=? AND day_date>=? ORDER BY day_date;";

static constexpr const char* DELETE_BLACKOUT =
    "DELETE FROM blackout_dates WHERE instructor_id=? AND id=?;";

// audit / outbox

static constexpr const char* INSERT_AUDIT =
    "INSERT INTO availability_audit(id,instructor_id,actor_id,action,target_date,before_json,after_json,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_AUDIT =
    "SELECT id,instructor_id,actor_id,action,target_date,before_json,after_json,created_at_ms"
    " FROM availability_audit WHERE instructor_id=? ORDER BY seq;";

static constexpr const char* INSERT_OUTBOX =
    "INSERT INTO availability_outbox(id,event_type,aggregate_id,payload_json,created_at_ms)"
    " VALUES(?,?,?,?,?);";

static constexpr const char* SELECT_OUTBOX =
    "SELECT id,event_type,aggregate_id,payload_json,created_at_ms"
    " FROM availability_outbox ORDER BY seq;";

}
