#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace issueflow::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  ThrowIfFailed(db_->BeginImmediate(), "begin issue store transaction");
  open_ = true;
}

SqliteTransaction::~SqliteTransaction() {
  if (!open_) return;
  if (auto undone = db_->Rollback(); !undone) {
    ISSUEFLOW_LOG_WARN("sqlite rollback failed", {observability::StringField("path", db_->Path()),
                                                  observability::ErrorField(undone.message)});
  }
}

void SqliteTransaction::Commit() {
  auto result = db_->Commit();
  // a COMMIT that hit SQLITE_BUSY leaves the transaction open for the destructor
  open_ = db_->InTransaction();
  ThrowIfFailed(result, "commit issue store transaction");
  committed_ = true;
}

void SqliteTransaction::Rollback() {
  if (!open_) return;
  open_ = false;
  ThrowIfFailed(db_->Rollback(), "roll back issue store transaction");
}

} // namespace issueflow::db::sqlite
