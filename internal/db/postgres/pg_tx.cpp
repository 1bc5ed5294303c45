#include "pg_tx.hpp"

#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace issueflow::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  conn_ = pool->Acquire();
  try {
    tx_ = std::make_unique<pqxx::work>(*conn_);
    tx_->exec("SET LOCAL lock_timeout = " + std::to_string(pool->LockTimeoutMs()));
  } catch (const pqxx::broken_connection& e) {
    throw util::StoreUnavailable(std::string("postgres connection lost: ") + e.what());
  }
}

PgTransaction::~PgTransaction() {
  if (finished_) return;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    ISSUEFLOW_LOG_WARN("postgres rollback failed", {observability::ErrorField(e.what())});
  }
}

void PgTransaction::LockGraph() {
  if (graph_locked_) return;
  tx_->exec("LOCK TABLE dependencies IN SHARE ROW EXCLUSIVE MODE");
  graph_locked_ = true;
}

void PgTransaction::Commit() {
  finished_ = true;
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    throw util::Conflict(std::string("postgres commit conflict: ") + e.what());
  } catch (const pqxx::in_doubt_error& e) {
    throw util::StoreUnavailable(std::string("postgres commit outcome unknown: ") + e.what());
  } catch (const pqxx::broken_connection& e) {
    throw util::StoreUnavailable(std::string("postgres connection lost: ") + e.what());
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  tx_->abort();
}

} // namespace issueflow::db::postgres
