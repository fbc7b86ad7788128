#include "factory.hpp"

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/observability/logging.hpp"
#if RELAYNORM_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if RELAYNORM_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace relaynorm::factory {

using observability::IntField;
using observability::StringField;
using relaynorm::runtime::config::DatabaseConfig;
using relaynorm::runtime::config::RuntimeConfig;

namespace {

#if RELAYNORM_DB_POSTGRES
// Runs the whole migration inside one transaction on a pooled connection.
class PgMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::connection& conn) : tx_(conn) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

  void Commit() {
    tx_.commit();
  }

 private:
  pqxx::work tx_;
};
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const DatabaseConfig& database) {
  if (database.has_sqlite()) {
#if RELAYNORM_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sql::RunMigrations(*sqlite_db, db::sql::SqliteSchema());
    RELAYNORM_LOG_INFO("Repository ready", {StringField("backend", "sqlite"), StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if RELAYNORM_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? 8u : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    {
      auto                conn = pool->Acquire();
      PgMigrationExecutor executor(*conn);
      db::sql::RunMigrations(executor, db::sql::PostgresSchema());
      executor.Commit();
    }
    RELAYNORM_LOG_INFO("Repository ready", {StringField("backend", "postgres"), IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  RELAYNORM_LOG_INFO("Repository ready", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

Application::Application(RuntimeConfig runtime_config) : config(std::move(runtime_config)) {
  registry   = std::make_unique<config::ProfileRegistry>(config);
  strategies = std::make_unique<strategy::StrategyDispatcher>(registry->Profiles());
  repository = BuildRepository(config.database());
  processor  = std::make_unique<pipeline::DocumentProcessor>(config, *registry, *strategies, repository);
}

/*
    Build full application dependency graph
*/
std::unique_ptr<Application> Build(RuntimeConfig config) {
  auto app = std::make_unique<Application>(std::move(config));
  RELAYNORM_LOG_INFO("Application built", {IntField("profiles", static_cast<std::int64_t>(app->strategies->Size()))});
  return app;
}

} // namespace relaynorm::factory
