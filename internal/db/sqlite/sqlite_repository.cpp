#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace issueflow::db::sqlite {

using issueflow::db::ErrorCode;
using issueflow::db::Result;
using issueflow::model::IssueStatus;

namespace {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

Statement Prepare(sqlite3* db, const char* sql, int* rc) {
  sqlite3_stmt* st = nullptr;
  *rc              = sqlite3_prepare_v2(db, sql, -1, &st, nullptr);
  return Statement(st, &sqlite3_finalize);
}

// Reads have no Result channel; a failed read must not look like "no rows".
void ThrowReadError(sqlite3* db, int rc, const char* what) {
  ThrowIfFailed(SqliteDB::Classify(db, rc), what);
}

Statement PrepareRead(sqlite3* db, const char* sql) {
  int  rc = SQLITE_OK;
  auto st = Prepare(db, sql, &rc);
  if (rc != SQLITE_OK) ThrowReadError(db, rc, "sqlite prepare");
  return st;
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindStatus(sqlite3_stmt* st, int idx, IssueStatus status) {
  BindText(st, idx, std::string(issueflow::model::ToString(status)));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

model::IssueRecord ReadIssue(sqlite3_stmt* st) {
  model::IssueRecord r;
  r.id            = ColText(st, 0);
  r.title         = ColText(st, 1);
  r.description   = ColText(st, 2);
  r.notes         = ColText(st, 3);
  r.metadata_json = ColText(st, 4);
  r.issue_type    = ColText(st, 5);
  r.priority      = ColI32(st, 6);

  auto status = issueflow::model::ParseIssueStatus(ColText(st, 7));
  if (!status) {
    throw std::runtime_error("issue " + r.id + " has an unknown stored status");
  }
  r.status = *status;

  r.assignee       = ColText(st, 8);
  r.defer_until_ms = ColU64(st, 9);
  r.close_reason   = ColText(st, 10);
  r.verification   = ColText(st, 11);
  r.created_at_ms  = ColU64(st, 12);
  r.updated_at_ms  = ColU64(st, 13);
  r.closed_at_ms   = ColU64(st, 14);
  r.seq            = ColU64(st, 15);
  r.version        = ColU64(st, 16);
  return r;
}

model::DependencyRecord ReadDependency(sqlite3_stmt* st) {
  model::DependencyRecord r;
  r.from_id = ColText(st, 0);
  r.to_id   = ColText(st, 1);

  auto type = issueflow::model::ParseDependencyType(ColText(st, 2));
  if (!type) {
    throw std::runtime_error("dependency " + r.from_id + " -> " + r.to_id + " has an unknown stored type");
  }
  r.type          = *type;
  r.created_at_ms = ColU64(st, 3);
  r.note          = ColText(st, 4);
  return r;
}

std::vector<model::DependencyRecord> ReadDependencies(sqlite3* db, const char* sql, const std::string& id) {
  auto st = PrepareRead(db, sql);
  BindText(st.get(), 1, id);

  std::vector<model::DependencyRecord> out;
  int                                  rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadDependency(st.get()));
  }
  if (rc != SQLITE_DONE) ThrowReadError(db, rc, "sqlite read dependencies");
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  return SqliteDB::Classify(db, rc);
}

bool SqliteRepository::Exists(sqlite3* db, const std::string& id) {
  auto st = PrepareRead(db, sql::ISSUE_EXISTS);
  BindText(st.get(), 1, id);
  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) ThrowReadError(db, rc, "sqlite issue lookup");
  return rc == SQLITE_ROW;
}

// ------------------------------------------------------------------
// Issues
// ------------------------------------------------------------------

Result SqliteRepository::InsertIssue(Transaction& t, model::IssueRecord& r) {
  auto* db = TX(t).Handle();

  int  rc = SQLITE_OK;
  auto st = Prepare(db, sql::INSERT_ISSUE, &rc);
  if (rc != SQLITE_OK) return Translate(db, rc);

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.title);
  BindText(st.get(), 3, r.description);
  BindText(st.get(), 4, r.notes);
  BindText(st.get(), 5, r.metadata_json);
  BindText(st.get(), 6, r.issue_type);
  BindI32(st.get(), 7, r.priority);
  BindStatus(st.get(), 8, r.status);
  BindText(st.get(), 9, r.assignee);
  BindU64(st.get(), 10, r.defer_until_ms);
  BindText(st.get(), 11, r.close_reason);
  BindText(st.get(), 12, r.verification);
  BindU64(st.get(), 13, r.created_at_ms);
  BindU64(st.get(), 14, r.updated_at_ms);
  BindU64(st.get(), 15, r.closed_at_ms);

  rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) return Translate(db, rc);

  r.seq     = ColU64(st.get(), 0);
  r.version = 1;

  // drain RETURNING so the statement completes
  rc = sqlite3_step(st.get());
  return Translate(db, rc);
}

std::optional<model::IssueRecord> SqliteRepository::GetIssue(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareRead(db, sql::SELECT_ISSUE);
  BindText(st.get(), 1, id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) ThrowReadError(db, rc, "sqlite get issue");
  return ReadIssue(st.get());
}

std::vector<model::IssueRecord> SqliteRepository::ListIssues(Transaction& t, const IssueFilter& filter) {
  auto* db = TX(t).Handle();

  std::string sql = "SELECT " ISSUEFLOW_ISSUE_COLUMNS " FROM issues WHERE 1=1";
  if (filter.status) sql += " AND status=?";
  if (filter.assignee) sql += " AND assignee=?";
  if (filter.issue_type) sql += " AND issue_type=?";
  if (filter.priority) sql += " AND priority=?";
  sql += " ORDER BY seq";
  if (filter.limit > 0) sql += " LIMIT " + std::to_string(filter.limit);
  sql += ";";

  auto st  = PrepareRead(db, sql.c_str());
  int  idx = 1;
  if (filter.status) BindStatus(st.get(), idx++, *filter.status);
  if (filter.assignee) BindText(st.get(), idx++, *filter.assignee);
  if (filter.issue_type) BindText(st.get(), idx++, *filter.issue_type);
  if (filter.priority) BindI32(st.get(), idx++, *filter.priority);

  std::vector<model::IssueRecord> out;
  int                             rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadIssue(st.get()));
  }
  if (rc != SQLITE_DONE) ThrowReadError(db, rc, "sqlite list issues");
  return out;
}

Result SqliteRepository::UpdateIssue(Transaction& t, const model::IssueRecord& r) {
  auto* db = TX(t).Handle();

  int  rc = SQLITE_OK;
  auto st = Prepare(db, sql::UPDATE_ISSUE, &rc);
  if (rc != SQLITE_OK) return Translate(db, rc);

  BindText(st.get(), 1, r.title);
  BindText(st.get(), 2, r.description);
  BindText(st.get(), 3, r.notes);
  BindText(st.get(), 4, r.metadata_json);
  BindText(st.get(), 5, r.issue_type);
  BindI32(st.get(), 6, r.priority);
  BindStatus(st.get(), 7, r.status);
  BindText(st.get(), 8, r.assignee);
  BindU64(st.get(), 9, r.defer_until_ms);
  BindText(st.get(), 10, r.close_reason);
  BindText(st.get(), 11, r.verification);
  BindU64(st.get(), 12, r.updated_at_ms);
  BindU64(st.get(), 13, r.closed_at_ms);
  BindText(st.get(), 14, r.id);
  BindU64(st.get(), 15, r.version);

  rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  if (sqlite3_changes(db) == 0) {
    if (!Exists(db, r.id)) return Result::Err(ErrorCode::NotFound, "issue " + r.id + " not found");
    return Result::Err(ErrorCode::Conflict, "issue " + r.id + " changed since it was read");
  }
  return Result::Ok();
}

Result SqliteRepository::DeleteIssue(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  int  rc = SQLITE_OK;
  auto st = Prepare(db, sql::DELETE_ISSUE, &rc);
  if (rc != SQLITE_OK) return Translate(db, rc);

  BindText(st.get(), 1, id);
  rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  // labels and dependencies go through ON DELETE CASCADE
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "issue " + id + " not found");
  return Result::Ok();
}

Result SqliteRepository::CompareAndSetStatus(Transaction& t, const StatusTransition& cas) {
  auto* db = TX(t).Handle();

  int  rc = SQLITE_OK;
  auto st = Prepare(db, sql::CAS_STATUS, &rc);
  if (rc != SQLITE_OK) return Translate(db, rc);

  const bool closing = cas.new_status == IssueStatus::kClosed;
  BindStatus(st.get(), 1, cas.new_status);
  BindText(st.get(), 2, cas.new_assignee);
  BindText(st.get(), 3, closing ? cas.close_reason : std::string());
  BindText(st.get(), 4, closing ? cas.verification : std::string());
  BindU64(st.get(), 5, closing ? cas.at_ms : 0);
  if (cas.notes) {
    BindText(st.get(), 6, *cas.notes);
  } else {
    sqlite3_bind_null(st.get(), 6);
  }
  BindU64(st.get(), 7, cas.at_ms);
  BindText(st.get(), 8, cas.id);
  BindStatus(st.get(), 9, cas.expected_status);
  BindText(st.get(), 10, cas.expected_assignee);

  rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  if (sqlite3_changes(db) == 0) {
    if (!Exists(db, cas.id)) return Result::Err(ErrorCode::NotFound, "issue " + cas.id + " not found");
    return Result::Err(ErrorCode::Conflict, "issue " + cas.id + " status/assignee changed");
  }
  return Result::Ok();
}

uint64_t SqliteRepository::AllocateChildNumber(Transaction& t, const std::string& parent_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareRead(db, sql::NEXT_CHILD_NUMBER);
  BindText(st.get(), 1, parent_id);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) ThrowReadError(db, rc, "sqlite allocate child number");
  auto next = ColU64(st.get(), 0);

  rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) ThrowReadError(db, rc, "sqlite allocate child number");
  return next;
}

// ------------------------------------------------------------------
// Labels
// ------------------------------------------------------------------

Result SqliteRepository::AddLabel(Transaction& t, const std::string& issue_id, const std::string& label) {
  auto* db = TX(t).Handle();

  int  rc = SQLITE_OK;
  auto st = Prepare(db, sql::INSERT_LABEL, &rc);
  if (rc != SQLITE_OK) return Translate(db, rc);

  BindText(st.get(), 1, issue_id);
  BindText(st.get(), 2, label);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::RemoveLabel(Transaction& t, const std::string& issue_id, const std::string& label) {
  auto* db = TX(t).Handle();

  int  rc = SQLITE_OK;
  auto st = Prepare(db, sql::DELETE_LABEL, &rc);
  if (rc != SQLITE_OK) return Translate(db, rc);

  BindText(st.get(), 1, issue_id);
  BindText(st.get(), 2, label);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<std::string> SqliteRepository::GetLabels(Transaction& t, const std::string& issue_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareRead(db, sql::SELECT_LABELS);
  BindText(st.get(), 1, issue_id);

  std::vector<std::string> out;
  int                      rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ColText(st.get(), 0));
  }
  if (rc != SQLITE_DONE) ThrowReadError(db, rc, "sqlite read labels");
  return out;
}

// ------------------------------------------------------------------
// Dependencies
// ------------------------------------------------------------------

Result SqliteRepository::InsertDependency(Transaction& t, const model::DependencyRecord& r) {
  auto* db = TX(t).Handle();

  int  rc = SQLITE_OK;
  auto st = Prepare(db, sql::INSERT_DEPENDENCY, &rc);
  if (rc != SQLITE_OK) return Translate(db, rc);

  BindText(st.get(), 1, r.from_id);
  BindText(st.get(), 2, r.to_id);
  BindText(st.get(), 3, std::string(issueflow::model::ToString(r.type)));
  BindU64(st.get(), 4, r.created_at_ms);
  BindText(st.get(), 5, r.note);

  rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  // ON CONFLICT DO NOTHING: zero changes means the exact triple exists
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::AlreadyExists, "dependency already exists");
  return Result::Ok();
}

Result SqliteRepository::DeleteDependency(Transaction& t, const model::DependencyKey& key) {
  auto* db = TX(t).Handle();

  int  rc = SQLITE_OK;
  auto st = Prepare(db, sql::DELETE_DEPENDENCY, &rc);
  if (rc != SQLITE_OK) return Translate(db, rc);

  BindText(st.get(), 1, key.from_id);
  BindText(st.get(), 2, key.to_id);
  BindText(st.get(), 3, std::string(issueflow::model::ToString(key.type)));

  rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "dependency not found");
  return Result::Ok();
}

std::vector<model::DependencyRecord> SqliteRepository::GetDependencies(Transaction& t, const std::string& issue_id) {
  return ReadDependencies(TX(t).Handle(), sql::SELECT_DEPENDENCIES, issue_id);
}

std::vector<model::DependencyRecord> SqliteRepository::GetDependents(Transaction& t, const std::string& issue_id) {
  return ReadDependencies(TX(t).Handle(), sql::SELECT_DEPENDENTS, issue_id);
}

Result SqliteRepository::LockDependencyGraph(Transaction&) {
  return Result::Ok();
}

} // namespace issueflow::db::sqlite
