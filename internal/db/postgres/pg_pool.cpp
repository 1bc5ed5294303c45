#include "pg_pool.hpp"

#include "internal/util/errors.hpp"

namespace issueflow::db::postgres {

#define ISSUEFLOW_PG_ISSUE_COLUMNS                                                                                     \
  "id,title,description,notes,metadata,issue_type,priority,status,assignee,defer_until_ms,close_reason,verification," \
  "created_at_ms,updated_at_ms,closed_at_ms,seq,version"

#define ISSUEFLOW_PG_DEPENDENCY_COLUMNS "issue_id,depends_on_id,type,created_at_ms,note"

PgPool::PgPool(std::string conninfo, std::size_t max_connections, int lock_timeout_ms)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections), lock_timeout_ms_(lock_timeout_ms) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        if (conn->is_open()) {
          return Wrap(conn.release());
        }
        --live_connections_;
        continue;
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (const pqxx::broken_connection& e) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw util::StoreUnavailable(std::string("postgres connect failed: ") + e.what());
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_issue",
               "INSERT INTO issues(id,title,description,notes,metadata,issue_type,priority,status,assignee,defer_until_ms,"
               "close_reason,verification,created_at_ms,updated_at_ms,closed_at_ms,version)"
               " VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,1) RETURNING seq");

  conn.prepare("get_issue", "SELECT " ISSUEFLOW_PG_ISSUE_COLUMNS " FROM issues WHERE id=$1");

  conn.prepare("update_issue",
               "UPDATE issues SET title=$2,description=$3,notes=$4,metadata=$5,issue_type=$6,priority=$7,status=$8,"
               "assignee=$9,defer_until_ms=$10,close_reason=$11,verification=$12,updated_at_ms=$13,closed_at_ms=$14,"
               "version=version+1 WHERE id=$1 AND version=$15");

  // Under READ COMMITTED a concurrent UPDATE of the same row waits for the
  // row lock and then re-evaluates the WHERE clause, which makes this a
  // true compare-and-set.
  conn.prepare("cas_status",
               "UPDATE issues SET status=$2,assignee=$3,close_reason=$4,verification=$5,closed_at_ms=$6,"
               "notes=COALESCE($7,notes),updated_at_ms=$8,version=version+1"
               " WHERE id=$1 AND status=$9 AND assignee=$10");

  conn.prepare("delete_issue", "DELETE FROM issues WHERE id=$1");

  conn.prepare("issue_exists", "SELECT 1 FROM issues WHERE id=$1");

  conn.prepare("next_child_number",
               "INSERT INTO child_counters(parent_id,last_child) VALUES($1,1)"
               " ON CONFLICT(parent_id) DO UPDATE SET last_child=child_counters.last_child+1 RETURNING last_child");

  conn.prepare("insert_label", "INSERT INTO labels(issue_id,label) VALUES($1,$2) ON CONFLICT(issue_id,label) DO NOTHING");
  conn.prepare("delete_label", "DELETE FROM labels WHERE issue_id=$1 AND label=$2");
  conn.prepare("select_labels", "SELECT label FROM labels WHERE issue_id=$1 ORDER BY label");

  conn.prepare("insert_dependency",
               "INSERT INTO dependencies(" ISSUEFLOW_PG_DEPENDENCY_COLUMNS ") VALUES($1,$2,$3,$4,$5)"
               " ON CONFLICT(issue_id,depends_on_id,type) DO NOTHING");
  conn.prepare("delete_dependency", "DELETE FROM dependencies WHERE issue_id=$1 AND depends_on_id=$2 AND type=$3");
  conn.prepare("select_dependencies",
               "SELECT " ISSUEFLOW_PG_DEPENDENCY_COLUMNS " FROM dependencies WHERE issue_id=$1 ORDER BY depends_on_id,type");
  conn.prepare("select_dependents",
               "SELECT " ISSUEFLOW_PG_DEPENDENCY_COLUMNS " FROM dependencies WHERE depends_on_id=$1 ORDER BY issue_id,type");
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

} // namespace issueflow::db::postgres
