#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace issueflow::db::postgres {

/*
  READ COMMITTED transaction on a pooled connection.

  Status changes are guarded row by row (cas_status), so claims on different
  issues never wait on each other. Edge inserts additionally call LockGraph()
  before the cycle check; two concurrent inserts that would close a cycle
  between them are serialised there.

  lock_timeout is set for the transaction, so a writer stuck behind another
  one fails as ErrorCode::Busy like a sqlite writer past its busy timeout.
*/
class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction() override;

  pqxx::work& Work() {
    return *tx_;
  }

  // SHARE ROW EXCLUSIVE on dependencies until commit; repeated calls are free.
  void LockGraph();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       tx_;
  bool                              graph_locked_ = false;
  bool                              committed_    = false;
  bool                              finished_     = false;
};

} // namespace issueflow::db::postgres
