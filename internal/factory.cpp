#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#if ISSUEFLOW_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if ISSUEFLOW_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace issueflow::factory {

namespace {

#if ISSUEFLOW_DB_SQLITE
void BootstrapSqliteSchema(db::sqlite::SqliteDB& sqlite_db) {
  std::vector<std::string> statements(db::sql::kSqliteSchema.begin(), db::sql::kSqliteSchema.end());
  statements.push_back("INSERT OR IGNORE INTO schema_migrations (version, applied_at_ms) VALUES (" + std::to_string(db::sql::kSchemaVersion) +
                       ", " + std::to_string(util::NowMs()) + ");");
  db::sqlite::ThrowIfFailed(sqlite_db.ExecAtomically(statements), "bootstrap schema in " + sqlite_db.Path());

  // an existing file from another tool fails here instead of on first use
  db::sqlite::ThrowIfFailed(sqlite_db.Exec("SELECT id,status,seq,version FROM issues LIMIT 1;"), "check issues table");
  db::sqlite::ThrowIfFailed(sqlite_db.Exec("SELECT issue_id,depends_on_id,type,note FROM dependencies LIMIT 1;"), "check dependencies table");
  db::sqlite::ThrowIfFailed(sqlite_db.Exec("SELECT version FROM schema_migrations LIMIT 1;"), "check schema_migrations table");
}
#endif

#if ISSUEFLOW_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  // concurrent first runs would race on CREATE TABLE IF NOT EXISTS
  tx.exec("SELECT pg_advisory_xact_lock(7428117);");
  for (const auto* sql : db::sql::kPostgresSchema) {
    tx.exec(sql);
  }
  tx.exec("INSERT INTO schema_migrations (version) VALUES (" + std::to_string(db::sql::kSchemaVersion) + ") ON CONFLICT DO NOTHING;");

  tx.exec("SELECT id,status,seq,version FROM issues LIMIT 1;");
  tx.exec("SELECT issue_id,depends_on_id,type,note FROM dependencies LIMIT 1;");
  tx.exec("SELECT version FROM schema_migrations LIMIT 1;");
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const issueflow::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if ISSUEFLOW_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("database.sqlite.path must be set");
    }
    db::sqlite::SqliteOptions options;
    options.path = database.sqlite().path();
    if (database.sqlite().busy_timeout_ms() > 0) {
      options.busy_timeout_ms = static_cast<int>(database.sqlite().busy_timeout_ms());
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(options);
    BootstrapSqliteSchema(*sqlite_db);
    ISSUEFLOW_LOG_DEBUG("sqlite store opened", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if ISSUEFLOW_DB_POSTGRES
    const std::size_t max_connections = database.postgres().max_connections() == 0 ? 16 : database.postgres().max_connections();
    const int         lock_timeout_ms = database.postgres().lock_timeout_ms() == 0 ? 5000 : static_cast<int>(database.postgres().lock_timeout_ms());
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections, lock_timeout_ms);
    BootstrapPostgresSchema(pool);
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

flow::FlowPolicy MakeFlowPolicy(const issueflow::runtime::config::FlowConfig& config) {
  flow::FlowPolicy policy;
  if (config.max_claims_per_actor() > 0) {
    policy.max_claims_per_actor = config.max_claims_per_actor();
  }
  if (config.max_claim_attempts() > 0) {
    policy.max_claim_attempts = config.max_claim_attempts();
  }
  if (config.has_require_close_reason()) {
    policy.require_close_reason = config.require_close_reason();
  }
  if (config.has_require_verification()) {
    policy.require_verification = config.require_verification();
  }
  policy.require_children_closed = config.require_children_closed();
  if (config.has_reject_secret_markers()) {
    policy.reject_secret_markers = config.reject_secret_markers();
  }
  return policy;
}

RuntimeDependencies BuildWithRepository(const issueflow::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository) {
  RuntimeDependencies deps;
  deps.repository = std::move(repository);

  auto graph    = std::make_shared<const graph::DependencyGraph>();
  auto resolver = std::make_shared<const status::StatusResolver>(graph);

  core::ServiceContext ctx;
  ctx.repository = deps.repository;
  ctx.graph      = graph;
  ctx.resolver   = resolver;
  if (!config.issues().prefix().empty()) {
    ctx.policy.prefix = config.issues().prefix();
  }
  ctx.policy.custom_types.assign(config.issues().custom_types().begin(), config.issues().custom_types().end());

  deps.graph           = graph;
  deps.resolver        = resolver;
  deps.issue_service   = std::make_shared<core::IssueService>(ctx);
  deps.flow_controller = std::make_shared<flow::FlowController>(ctx, MakeFlowPolicy(config.flow()), deps.issue_service);
  return deps;
}

/*
    Build full application dependency graph
*/
RuntimeDependencies Build(const issueflow::runtime::config::RuntimeConfig& config) {
  return BuildWithRepository(config, BuildRepository(config));
}

} // namespace issueflow::factory
