#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace issueflow::db::sqlite {

/*
  BEGIN IMMEDIATE transaction on a SqliteDB.

  The constructor takes the write lock, so a claim's ready scan, its
  compare-and-set and the cycle check before an edge insert all run with no
  other writer in between. Failing to get the lock within the busy timeout
  throws util::StoreUnavailable from the constructor; nothing has been read
  at that point.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  std::shared_ptr<SqliteDB> db_;
  bool                      open_      = false;
  bool                      committed_ = false;
};

} // namespace issueflow::db::sqlite
