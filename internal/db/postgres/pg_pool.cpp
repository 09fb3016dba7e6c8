#include "pg_pool.hpp"

#include "internal/db/sql/schema.hpp"

namespace availability::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::ApplySchema() {
  auto       conn = Acquire();
  pqxx::work tx(*conn);
  for (const char* ddl : sql::kPostgresSchema) {
    tx.exec(ddl);
  }
  tx.commit();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  // Bits travel as hex text so no bytea conversion is needed client-side.
  conn.prepare("get_day",
               "SELECT instructor_id, day_date, encode(bits, 'hex'), updated_at_ms "
               "FROM availability_days WHERE instructor_id=$1 AND day_date=$2");

  conn.prepare("get_days",
               "SELECT instructor_id, day_date, encode(bits, 'hex'), updated_at_ms "
               "FROM availability_days WHERE instructor_id=$1 AND day_date>=$2 AND day_date<=$3 "
               "ORDER BY day_date");

  conn.prepare("upsert_day",
               "INSERT INTO availability_days(instructor_id,day_date,bits,updated_at_ms) "
               "VALUES($1,$2,decode($3,'hex'),$4) "
               "ON CONFLICT(instructor_id,day_date) DO UPDATE SET bits=EXCLUDED.bits, updated_at_ms=EXCLUDED.updated_at_ms");

  conn.prepare("delete_day", "DELETE FROM availability_days WHERE instructor_id=$1 AND day_date=$2");

  conn.prepare("lock_week", "SELECT pg_advisory_xact_lock(hashtext($1)::bigint)");

  conn.prepare("insert_blackout",
               "INSERT INTO blackout_dates(id,instructor_id,day_date,reason,created_at_ms) VALUES($1,$2,$3,$4,$5)");

  conn.prepare("insert_audit",
               "INSERT INTO availability_audit(id,instructor_id,actor_id,action,target_date,before_json,after_json,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6::jsonb,$7::jsonb,$8)");

  conn.prepare("insert_outbox",
               "INSERT INTO availability_outbox(id,event_type,aggregate_id,payload_json,created_at_ms) "
               "VALUES($1,$2,$3,$4::jsonb,$5)");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace availability::db::postgres
