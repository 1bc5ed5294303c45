#include "internal/db/sqlite/sqlite_db.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using issueflow::db::ErrorCode;
using issueflow::db::sqlite::SqliteDB;
using issueflow::db::sqlite::SqliteOptions;
using issueflow::db::sqlite::SqliteTransaction;

class TempStore {
 public:
  explicit TempStore(const std::string& name)
      : path_((std::filesystem::temp_directory_path() / ("issueflow_unit_" + name + "_" + std::to_string(issueflow::util::NowMs()) + ".db")).string()) {
  }

  ~TempStore() {
    std::filesystem::remove(path_);
    std::filesystem::remove(path_ + "-wal");
    std::filesystem::remove(path_ + "-shm");
  }

  const std::string& Path() const {
    return path_;
  }

  std::shared_ptr<SqliteDB> Open(int busy_timeout_ms = 5000) const {
    SqliteOptions options;
    options.path            = path_;
    options.busy_timeout_ms = busy_timeout_ms;
    return std::make_shared<SqliteDB>(options);
  }

 private:
  std::string path_;
};

void TestFailedBatchRollsBackEverything() {
  TempStore store("sqlite_batch");
  auto      db = store.Open();

  const auto result = db->ExecAtomically({
      "CREATE TABLE claims (id TEXT PRIMARY KEY);",
      "INSERT INTO claims VALUES ('a');",
      "INSERT INTO claims VALUES ('a');",
  });
  assert(!result);
  assert(result.code == ErrorCode::AlreadyExists);
  assert(!db->InTransaction());

  // the CREATE TABLE went with the rollback
  const auto lookup = db->Exec("SELECT id FROM claims;");
  assert(!lookup);
  assert(lookup.code == ErrorCode::InternalError);

  assert(db->ExecAtomically({"CREATE TABLE claims (id TEXT PRIMARY KEY);", "INSERT INTO claims VALUES ('a');"}));
  assert(db->Exec("SELECT id FROM claims;"));
}

void TestSecondBeginOnSameConnectionIsRejected() {
  TempStore store("sqlite_nested");
  auto      db = store.Open();

  assert(db->BeginImmediate());
  assert(db->InTransaction());

  const auto nested = db->BeginImmediate();
  assert(!nested);
  assert(nested.code == ErrorCode::Unsupported);
  assert(db->InTransaction());

  assert(db->Rollback());
  assert(!db->InTransaction());
  // nothing open: a second rollback is a no-op
  assert(db->Rollback());
}

void TestHeldWriteLockIsBusyForOtherConnection() {
  TempStore store("sqlite_busy");
  auto      holder = store.Open();
  auto      waiter = store.Open(50);

  assert(holder->Exec("CREATE TABLE issues_seen (id TEXT);"));
  assert(holder->BeginImmediate());

  const auto busy = waiter->BeginImmediate();
  assert(!busy);
  assert(busy.code == ErrorCode::Busy);
  assert(issueflow::db::IsTransient(busy.code));
  assert(!waiter->InTransaction());

  bool unavailable = false;
  try {
    SqliteTransaction tx(waiter);
  } catch (const issueflow::util::StoreUnavailable& e) {
    unavailable = std::string(e.what()).find("[busy]") != std::string::npos;
  }
  assert(unavailable);

  assert(holder->Rollback());

  SqliteTransaction tx(waiter);
  assert(waiter->InTransaction());
  tx.Commit();
  assert(tx.IsCommitted());
  assert(!waiter->InTransaction());
  tx.Rollback();
}

void TestUncommittedTransactionRollsBackOnScopeExit() {
  TempStore store("sqlite_scope");
  auto      db = store.Open();
  assert(db->Exec("CREATE TABLE notes (body TEXT);"));

  {
    SqliteTransaction tx(db);
    assert(db->Exec("INSERT INTO notes VALUES ('draft');"));
  }
  assert(!db->InTransaction());

  auto* handle = db->Handle();
  int   rows   = -1;
  auto  count  = [](void* out, int, char** values, char**) {
    *static_cast<int*>(out) = std::stoi(values[0]);
    return 0;
  };
  assert(sqlite3_exec(handle, "SELECT COUNT(*) FROM notes;", count, &rows, nullptr) == SQLITE_OK);
  assert(rows == 0);
}

void TestBootstrapFailureKeepsOriginalError() {
  TempStore store("sqlite_bootstrap");
  {
    // a foreign tool's issues table without the columns the indexes need
    auto db = store.Open();
    assert(db->Exec("CREATE TABLE issues (foo TEXT);"));
  }

  auto config = issueflow::config::ConfigLoader::Defaults();
  config.mutable_database()->mutable_sqlite()->set_path(store.Path());

  std::string error;
  try {
    issueflow::factory::BuildRepository(config);
  } catch (const std::runtime_error& e) {
    error = e.what();
  }
  assert(error.find("bootstrap schema") != std::string::npos);
  assert(error.find("rollback failed") == std::string::npos);

  // tables created before the failing index were rolled back with it
  auto db = store.Open();
  assert(!db->Exec("SELECT issue_id FROM labels;"));
  assert(!db->Exec("SELECT version FROM schema_migrations;"));
}

void TestBootstrapIsRepeatable() {
  TempStore store("sqlite_reopen");
  auto      config = issueflow::config::ConfigLoader::Defaults();
  config.mutable_database()->mutable_sqlite()->set_path(store.Path());

  auto first  = issueflow::factory::BuildRepository(config);
  auto second = issueflow::factory::BuildRepository(config);
  assert(first && second);
}

} // namespace

int main() {
  TestFailedBatchRollsBackEverything();
  TestSecondBeginOnSameConnectionIsRejected();
  TestHeldWriteLockIsBusyForOtherConnection();
  TestUncommittedTransactionRollsBackOnScopeExit();
  TestBootstrapFailureKeepsOriginalError();
  TestBootstrapIsRepeatable();

  std::cout << "issueflow_unit_sqlite_db: pass\n";
  return 0;
}
