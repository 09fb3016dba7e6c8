#pragma once

#include <array>

namespace availability::db::sql {

/*
  Bootstrap DDL, applied idempotently at startup.

  seq columns keep audit and outbox rows in insertion order.
*/

inline constexpr std::array<const char*, 5> kSqliteSchema = {
    "CREATE TABLE IF NOT EXISTS availability_days (instructor_id TEXT NOT NULL, day_date TEXT NOT NULL, bits BLOB NOT NULL CHECK(length(bits) = 6), updated_at_ms INTEGER NOT NULL, PRIMARY KEY (instructor_id, day_date));",
    "CREATE TABLE IF NOT EXISTS blackout_dates (id TEXT PRIMARY KEY, instructor_id TEXT NOT NULL, day_date TEXT NOT NULL, reason TEXT, created_at_ms INTEGER NOT NULL, UNIQUE(instructor_id, day_date));",
    "CREATE TABLE IF NOT EXISTS availability_audit (seq INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, instructor_id TEXT NOT NULL, actor_id TEXT, action TEXT NOT NULL, target_date TEXT NOT NULL, before_json TEXT, after_json TEXT, created_at_ms INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS availability_outbox (seq INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, event_type TEXT NOT NULL, aggregate_id TEXT NOT NULL, payload_json TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
    "CREATE INDEX IF NOT EXISTS availability_days_by_date ON availability_days(day_date);"};

inline constexpr std::array<const char*, 5> kPostgresSchema = {
    "CREATE TABLE IF NOT EXISTS availability_days (instructor_id TEXT NOT NULL, day_date TEXT NOT NULL, bits BYTEA NOT NULL CHECK(octet_length(bits) = 6), updated_at_ms BIGINT NOT NULL, PRIMARY KEY (instructor_id, day_date));",
    "CREATE TABLE IF NOT EXISTS blackout_dates (id TEXT PRIMARY KEY, instructor_id TEXT NOT NULL, day_date TEXT NOT NULL, reason TEXT, created_at_ms BIGINT NOT NULL, UNIQUE(instructor_id, day_date));",
    "CREATE TABLE IF NOT EXISTS availability_audit (seq BIGSERIAL PRIMARY KEY, id TEXT NOT NULL UNIQUE, instructor_id TEXT NOT NULL, actor_id TEXT, action TEXT NOT NULL, target_date TEXT NOT NULL, before_json JSONB, after_json JSONB, created_at_ms BIGINT NOT NULL);",
    "CREATE TABLE IF NOT EXISTS availability_outbox (seq BIGSERIAL PRIMARY KEY, id TEXT NOT NULL UNIQUE, event_type TEXT NOT NULL, aggregate_id TEXT NOT NULL, payload_json JSONB NOT NULL, created_at_ms BIGINT NOT NULL);",
    "CREATE INDEX IF NOT EXISTS availability_days_by_date ON availability_days(day_date);"};

} // namespace availability::db::sql
