#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include <google/protobuf/util/time_util.h>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/mirror/memory_mirror.hpp"
#include "internal/mirror/mirror_sync.hpp"
#include "internal/mirror/yaml_file_mirror.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#if SLOTKEEPER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if SLOTKEEPER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace slotkeeper::factory {

using namespace slotkeeper;
using google::protobuf::util::TimeUtil;

std::shared_ptr<db::Repository> BuildRepository(const slotkeeper::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if SLOTKEEPER_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("sqlite backend requires database.sqlite.path");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    sqlite_db->BootstrapSchema();
    SLOTKEEPER_LOG_INFO("Using sqlite repository", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if SLOTKEEPER_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().pool_size());
    pool->BootstrapSchema();
    SLOTKEEPER_LOG_INFO("Using postgres repository", {observability::IntField("pool_size", database.postgres().pool_size())});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  SLOTKEEPER_LOG_WARN("Using in-memory repository; state is lost on restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<mirror::BookingMirror> BuildMirror(const slotkeeper::runtime::config::RuntimeConfig& config) {
  if (config.mirror().has_yaml_file()) {
    if (config.mirror().yaml_file().path().empty()) {
      throw std::runtime_error("yaml_file mirror requires mirror.yaml_file.path");
    }
    SLOTKEEPER_LOG_INFO("Using yaml file mirror", {observability::StringField("path", config.mirror().yaml_file().path())});
    return std::make_shared<mirror::YamlFileMirror>(config.mirror().yaml_file().path());
  }
  return std::make_shared<mirror::MemoryMirror>();
}

/*
    Build full application dependency graph
*/
Application Build(const slotkeeper::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Store, projects, mirror
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.projects   = std::make_shared<const model::ProjectRegistry>(slotkeeper::config::ConfigLoader::BuildProjects(config));
  app.booking_mirror = BuildMirror(config);

  // ------------------------------------------------------------------
  // Mirror sync
  // ------------------------------------------------------------------
  auto sync            = std::make_shared<mirror::MirrorSync>(app.repository, app.booking_mirror);
  app.mirror_scheduler = std::make_shared<mirror::MirrorScheduler>();
  app.mirror_worker    = std::make_shared<mirror::MirrorWorker>(app.mirror_scheduler, sync);

  const auto& reconciliation = config.reconciliation();
  const auto  grace_ms       = TimeUtil::DurationToMilliseconds(reconciliation.grace_period());
  app.reconciler             = std::make_shared<mirror::MirrorReconciler>(app.repository, app.projects, app.booking_mirror, sync,
                                                                          static_cast<uint64_t>(grace_ms > 0 ? grace_ms : 0));
  if (reconciliation.enabled()) {
    app.reconcile_worker = std::make_shared<mirror::ReconcileWorker>(
        app.reconciler, std::chrono::milliseconds(TimeUtil::DurationToMilliseconds(reconciliation.interval())),
        static_cast<int>(reconciliation.horizon_days()));
  }

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.coordinator = std::make_shared<core::MessageCoordinator>(app.repository);
  app.allocator   = std::make_shared<core::SlotAllocator>(app.repository, app.projects, app.booking_mirror, app.mirror_scheduler);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.coordinator            = app.coordinator;
  ctx.allocator              = app.allocator;
  ctx.reconciler             = app.reconciler;
  ctx.repository             = app.repository;
  ctx.archive_after_hours    = config.coordinator().archive_after_hours();
  ctx.reconcile_horizon_days = reconciliation.horizon_days();

  app.conversation_service = std::make_shared<service::ConversationService>(ctx);
  app.booking_service      = std::make_shared<service::BookingService>(ctx);

  return app;
}

void Application::Start() {
  mirror_worker->Start();
  if (reconcile_worker) {
    reconcile_worker->Start();
  }
}

void Application::Stop() {
  if (reconcile_worker) {
    reconcile_worker->Stop();
  }
  mirror_worker->Stop();
}

} // namespace slotkeeper::factory
