#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace issueflow::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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

  // SHARE ROW EXCLUSIVE conflicts with itself and with row writers, so two
  // cycle-check-then-insert sequences cannot interleave.
  Result LockDependencyGraph(Transaction&) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
  static bool Exists(pqxx::work& work, const std::string& id);
};

}
