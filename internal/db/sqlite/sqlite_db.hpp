#pragma once

#include <sqlite3.h>

#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/result.hpp"

namespace issueflow::db::sqlite {

struct SqliteOptions {
  std::string path;

  // how long BEGIN IMMEDIATE waits for another writer before reporting Busy
  int busy_timeout_ms = 5000;
};

/*
  One sqlite3* connection to an issue store file.

  Writers are serialised by BEGIN IMMEDIATE on separate connections: a claim
  or a dependency insert holds the file's write lock from its first read to
  its commit. A writer that cannot get the lock within busy_timeout_ms sees
  ErrorCode::Busy, which the flow layer reports as transient_failure.

  sqlite allows one open transaction per connection. BeginImmediate() refuses
  to nest instead of letting sqlite fail the inner BEGIN.

  Statement errors are returned as db::Result, classified by Classify().
*/
class SqliteDB {
 public:
  explicit SqliteDB(SqliteOptions options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return options_.path;
  }

  // Maps a sqlite result code (extended codes enabled) to a portable code.
  static Result Classify(sqlite3* db, int rc);

  Result Exec(std::string_view sql);

  Result BeginImmediate();
  Result Commit();
  Result Rollback();

  bool InTransaction() const;

  /*
    Runs the statements inside one IMMEDIATE transaction. On the first
    failure the transaction is rolled back and that failure is returned; a
    rollback that fails as well is appended to its message.
  */
  Result ExecAtomically(const std::vector<std::string>& statements);

 private:
  void Configure();

  SqliteOptions options_;
  sqlite3*      db_ = nullptr;
};

// Throws util::StoreUnavailable for Busy/Timeout/Unavailable and
// std::runtime_error for anything else.
void ThrowIfFailed(const Result& result, std::string_view what);

} // namespace issueflow::db::sqlite
