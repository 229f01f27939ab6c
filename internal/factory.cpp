#include "factory.hpp"

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/scheduler/link_strategy.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#if FLOWSCHED_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if FLOWSCHED_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace flowsched::factory {

std::shared_ptr<db::Repository> BuildRepository(const flowsched::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if FLOWSCHED_DB_SQLITE
    const auto busy_timeout_ms = database.sqlite().busy_timeout_ms() == 0 ? db::sqlite::SqliteDB::kDefaultBusyTimeoutMs
                                                                          : static_cast<int>(database.sqlite().busy_timeout_ms());
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), busy_timeout_ms);
    sqlite_db->Bootstrap();
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::ConfigurationError("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if FLOWSCHED_DB_POSTGRES
    const std::size_t max_connections = database.postgres().max_connections() == 0 ? 16 : database.postgres().max_connections();
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    pool->Bootstrap();
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw util::ConfigurationError("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

scheduler::SweepOptions SweepOptionsFromConfig(const flowsched::runtime::config::SchedulerConfig& config) {
  scheduler::SweepOptions options;
  if (config.max_runs() != 0) {
    options.max_runs = config.max_runs();
  }
  if (config.has_horizon()) {
    options.horizon = util::ToDuration(config.horizon());
  }
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const flowsched::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  const auto strategy = scheduler::ResolveLinkStrategy(app.repository->Dialect(), config.scheduler().state_link_strategy());
  FLOWSCHED_LOG_INFO("database ready", {observability::StringField("dialect", app.repository->Dialect()),
                                        observability::StringField("state_link_strategy", scheduler::ToString(strategy))});

  // ------------------------------------------------------------------
  // Scheduling core
  // ------------------------------------------------------------------
  app.materializer = std::make_shared<scheduler::RunMaterializer>(app.repository, strategy);
  app.scheduler    = std::make_shared<scheduler::SchedulerService>(app.repository, app.materializer);

  // ------------------------------------------------------------------
  // Periodic sweep
  // ------------------------------------------------------------------
  if (config.scheduler().enabled()) {
    std::chrono::milliseconds loop_interval = scheduler::ScheduleWorker::kDefaultLoopInterval;
    if (config.scheduler().has_loop_interval()) {
      loop_interval = util::ToDuration(config.scheduler().loop_interval());
    }
    app.worker = std::make_shared<scheduler::ScheduleWorker>(app.scheduler, loop_interval, SweepOptionsFromConfig(config.scheduler()));
  }

  return app;
}

} // namespace flowsched::factory
