#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace issueflow::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertIssue(Transaction&, model::IssueRecord&) override;
  std::optional<model::IssueRecord> GetIssue(Transaction&, const std::string&) override;
  std::vector<model::IssueRecord> ListIssues(Transaction&, const IssueFilter&) override;
  Result UpdateIssue(Transaction&, const model::IssueRecord&) override;
  Result DeleteIssue(Transaction&, const std::string&) override;
  Result CompareAndSetStatus(Transaction&, const StatusTransition&) override;
  uint64_t AllocateChildNumber(Transaction&, const std::string& parent_id) override;

  Result AddLabel(Transaction&, const std::string& issue_id, const std::string& label) override;
  Result RemoveLabel(Transaction&, const std::string& issue_id, const std::string& label) override;
  std::vector<std::string> GetLabels(Transaction&, const std::string& issue_id) override;

  Result InsertDependency(Transaction&, const model::DependencyRecord&) override;
  Result DeleteDependency(Transaction&, const model::DependencyKey&) override;
  std::vector<model::DependencyRecord> GetDependencies(Transaction&, const std::string& issue_id) override;
  std::vector<model::DependencyRecord> GetDependents(Transaction&, const std::string& issue_id) override;

  // BEGIN IMMEDIATE already holds the database write lock.
  Result LockDependencyGraph(Transaction&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
  static bool Exists(sqlite3* db, const std::string& id);
};

}
