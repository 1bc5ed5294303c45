#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace issueflow::db::sqlite {

SqliteDB::SqliteDB(SqliteOptions options) : options_(std::move(options)) {
  const int rc = sqlite3_open_v2(options_.path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StoreUnavailable("cannot open issue store " + options_.path + ": " + msg);
  }

  sqlite3_extended_result_codes(db_, 1);
  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

Result SqliteDB::Classify(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  const std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
  switch (rc) {
    case SQLITE_CONSTRAINT_PRIMARYKEY:
    case SQLITE_CONSTRAINT_UNIQUE:
      return Result::Err(ErrorCode::AlreadyExists, msg);
    case SQLITE_CONSTRAINT_FOREIGNKEY:
      return Result::Err(ErrorCode::NotFound, msg);
    default:
      break;
  }

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, msg);
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::Unavailable, msg);
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, msg);
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, msg);
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, msg);
    default:
      return Result::Err(ErrorCode::InternalError, msg);
  }
}

Result SqliteDB::Exec(std::string_view sql) {
  const std::string text(sql);
  char*             err = nullptr;
  const int         rc  = sqlite3_exec(db_, text.c_str(), nullptr, nullptr, &err);
  if (rc == SQLITE_OK) return Result::Ok();

  auto result = Classify(db_, rc);
  if (err) {
    result.message = err;
    sqlite3_free(err);
  }
  return result;
}

Result SqliteDB::BeginImmediate() {
  if (InTransaction()) {
    return Result::Err(ErrorCode::Unsupported, "a transaction is already open on " + options_.path);
  }
  return Exec("BEGIN IMMEDIATE;");
}

Result SqliteDB::Commit() {
  return Exec("COMMIT;");
}

Result SqliteDB::Rollback() {
  if (!InTransaction()) return Result::Ok();
  return Exec("ROLLBACK;");
}

bool SqliteDB::InTransaction() const {
  return sqlite3_get_autocommit(db_) == 0;
}

Result SqliteDB::ExecAtomically(const std::vector<std::string>& statements) {
  if (auto begun = BeginImmediate(); !begun) return begun;

  auto result = Result::Ok();
  for (const auto& sql : statements) {
    result = Exec(sql);
    if (!result) break;
  }
  if (result) {
    result = Commit();
    if (result) return result;
  }

  // a failed COMMIT can leave the transaction open (SQLITE_BUSY)
  if (auto undone = Rollback(); !undone) {
    result.message += " (rollback failed: " + undone.message + ")";
  }
  return result;
}

void SqliteDB::Configure() {
  // WAL lets readers run while a claim holds the write lock
  ThrowIfFailed(Exec("PRAGMA journal_mode=WAL;"), "enable WAL");
  ThrowIfFailed(Exec("PRAGMA synchronous=NORMAL;"), "set synchronous");

  // dependency rows cascade with their issues
  ThrowIfFailed(Exec("PRAGMA foreign_keys=ON;"), "enable foreign keys");

  ThrowIfFailed(Classify(db_, sqlite3_busy_timeout(db_, options_.busy_timeout_ms)), "set busy timeout");
}

void ThrowIfFailed(const Result& result, std::string_view what) {
  if (result) return;

  std::string msg(what);
  msg += " [";
  msg += ToString(result.code);
  msg += "]: " + result.message;
  if (IsTransient(result.code)) {
    throw util::StoreUnavailable(msg);
  }
  throw std::runtime_error(msg);
}

} // namespace issueflow::db::sqlite
