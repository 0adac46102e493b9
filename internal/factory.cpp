#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#if WFRUN_DB_SQLITE
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if WFRUN_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace wfrun::factory {

namespace {

using observability::IntField;
using observability::StringField;

constexpr uint32_t kDefaultBusyTimeoutMs  = 5000;
constexpr uint32_t kDefaultMaxConnections  = 16;

std::shared_ptr<db::Repository> BuildRepository(const wfrun::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if WFRUN_DB_SQLITE
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("database.sqlite.path must be set");
    }
    const auto busy_timeout_ms = sqlite.busy_timeout_ms() == 0 ? kDefaultBusyTimeoutMs : sqlite.busy_timeout_ms();

    auto repository = std::make_shared<db::sqlite::SqliteRepository>(sqlite.path(), busy_timeout_ms);
    repository->Migrate();
    WFRUN_LOG_INFO("sqlite repository ready", {StringField("path", sqlite.path()), IntField("busy_timeout_ms", busy_timeout_ms)});
    return repository;
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if WFRUN_DB_POSTGRES
    const auto& postgres        = database.postgres();
    const auto  max_connections = postgres.max_connections() == 0 ? kDefaultMaxConnections : postgres.max_connections();

    auto pool       = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), max_connections);
    auto repository = std::make_shared<db::postgres::PgRepository>(std::move(pool));
    repository->Migrate();
    WFRUN_LOG_INFO("postgres repository ready", {IntField("max_connections", max_connections)});
    return repository;
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  WFRUN_LOG_INFO("memory repository ready");
  return std::make_shared<db::memory::MemoryRepository>();
}

engine::EngineOptions BuildEngineOptions(const wfrun::runtime::config::RuntimeConfig& config) {
  engine::EngineOptions options;
  if (!config.has_engine()) {
    return options;
  }

  const auto& engine = config.engine();
  if (engine.default_page_limit() < 0 || engine.max_page_limit() < 0) {
    throw std::runtime_error("engine page limits must not be negative");
  }
  if (engine.default_page_limit() > 0) options.default_page_limit = static_cast<std::size_t>(engine.default_page_limit());
  if (engine.max_page_limit() > 0) options.max_page_limit = static_cast<std::size_t>(engine.max_page_limit());
  return options;
}

} // namespace

Runtime BuildRuntime(const wfrun::runtime::config::RuntimeConfig& config, std::shared_ptr<engine::NodeDispatcher> dispatcher) {
  Runtime runtime;

  runtime.repository = BuildRepository(config);
  runtime.store      = std::make_shared<store::RunStore>(runtime.repository);
  runtime.tags       = std::make_shared<tags::TagIndexer>(runtime.repository);
  runtime.engine     = std::make_shared<engine::RunEngine>(runtime.store, runtime.tags, std::move(dispatcher), BuildEngineOptions(config));

  return runtime;
}

} // namespace wfrun::factory
