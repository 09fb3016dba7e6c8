#include "factory.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "internal/bitmap/bit_codec.hpp"
#include "internal/cache/memory_cache.hpp"
#include "internal/cache/safe_cache.hpp"
#include "internal/clock/local_date_resolver.hpp"
#include "internal/core/availability_engine.hpp"
#include "internal/core/booking_admission.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admission_server.hpp"
#include "internal/grpc/schedule_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/admission_service.hpp"
#include "internal/service/schedule_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/store/day_store.hpp"
#if AVAILABILITY_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if AVAILABILITY_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace availability::factory {

using availability::observability::BoolField;
using availability::observability::IntField;

namespace {

constexpr uint32_t kDefaultCacheTtlSeconds = 300;
constexpr uint32_t kDefaultCacheEntries    = 10000;

std::chrono::seconds TtlOrDefault(uint32_t seconds) {
  return std::chrono::seconds{seconds == 0 ? kDefaultCacheTtlSeconds : seconds};
}

std::shared_ptr<clock::LocalDateResolver> BuildClock(const availability::runtime::config::AvailabilityConfig& availability) {
  std::unordered_map<std::string, std::chrono::minutes> offsets;
  for (const auto& [instructor_id, minutes] : availability.instructor_utc_offset_minutes()) {
    offsets.emplace(instructor_id, std::chrono::minutes{minutes});
  }
  return std::make_shared<clock::FixedOffsetResolver>(std::chrono::minutes{availability.default_utc_offset_minutes()},
                                                      std::move(offsets));
}

cache::SafeCache BuildCache(const availability::runtime::config::CacheConfig& cache) {
  if (!cache.enabled()) {
    return cache::SafeCache{};
  }
  const auto entries = cache.max_entries() == 0 ? kDefaultCacheEntries : cache.max_entries();
  return cache::SafeCache{std::make_shared<cache::MemoryCache>(entries)};
}

} // namespace

core::EngineOptions BuildEngineOptions(const availability::runtime::config::RuntimeConfig& config) {
  const auto& availability = config.availability();

  if (availability.slot_minutes() != 0 && availability.slot_minutes() != static_cast<uint32_t>(bitmap::kSlotMinutes)) {
    throw std::invalid_argument("availability.slot_minutes must be " + std::to_string(bitmap::kSlotMinutes) + ", got " +
                                std::to_string(availability.slot_minutes()));
  }

  core::EngineOptions options;
  if (availability.forbid_past_edits()) {
    options.past_edit_policy = core::PastEditPolicy::kForbid;
  } else if (availability.past_edit_window_days() > 0) {
    options.past_edit_policy      = core::PastEditPolicy::kWindow;
    options.past_edit_window_days = static_cast<int>(availability.past_edit_window_days());
  } else {
    options.past_edit_policy = core::PastEditPolicy::kAllow;
  }
  options.audit_enabled        = availability.audit_enabled();
  options.suppress_past_events = availability.suppress_past_events();
  options.week_cache_ttl       = TtlOrDefault(config.cache().week_ttl_seconds());
  options.day_cache_ttl        = TtlOrDefault(config.cache().day_ttl_seconds());

  const auto& retention = availability.retention();
  options.retention.enabled = retention.enabled();
  options.retention.dry_run = retention.dry_run();
  if (retention.retention_days() > 0) {
    options.retention.retention_days = static_cast<int>(retention.retention_days());
  }
  if (retention.keep_recent_days() > 0) {
    options.retention.keep_recent_days = static_cast<int>(retention.keep_recent_days());
  }
  return options;
}

std::shared_ptr<db::Repository> BuildRepository(const availability::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if AVAILABILITY_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::invalid_argument("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    sqlite_db->ApplySchema();
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if AVAILABILITY_DB_POSTGRES
    const auto& postgres = database.postgres();
    auto pool = postgres.max_connections() > 0 ? std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), postgres.max_connections())
                                               : std::make_shared<db::postgres::PgPool>(postgres.connection_uri());
    pool->ApplySchema();
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const availability::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  const auto options = BuildEngineOptions(config);
  app.repository     = BuildRepository(config);

  auto day_store = std::make_shared<store::DayStore>(app.repository);
  app.engine = std::make_shared<core::AvailabilityEngine>(day_store, BuildCache(config.cache()), BuildClock(config.availability()), options);
  app.admission = std::make_shared<core::BookingAdmission>(app.engine);

  AVAILABILITY_LOG_INFO("engine configured", {IntField("past_edit_policy", static_cast<std::int64_t>(options.past_edit_policy)),
                                              IntField("past_edit_window_days", options.past_edit_window_days),
                                              BoolField("audit_enabled", options.audit_enabled),
                                              BoolField("cache_enabled", config.cache().enabled()),
                                              BoolField("retention_enabled", options.retention.enabled)});

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.engine    = app.engine;
  ctx.admission = app.admission;

  auto schedule_service  = std::make_shared<service::ScheduleService>(ctx);
  auto admission_service = std::make_shared<service::AdmissionService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::ScheduleServer>(schedule_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdmissionServer>(admission_service));

  return app;
}

} // namespace availability::factory
