#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace issueflow::db::memory {

class MemoryTransaction;

/*
  In-process backend.

  Each transaction works on a private copy of the committed state and
  records which rows it wrote. Commit applies only those rows, and only if
  none of them was committed by someone else after the snapshot was taken
  (first committer wins). Edge writes and LockDependencyGraph also write a
  shared "graph" row, so two transactions that both change the edge set
  cannot both commit.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  Result LockDependencyGraph(Transaction&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::IssueRecord> issues;
    std::unordered_map<std::string, std::set<std::string>> labels;
    std::map<model::DependencyKey, model::DependencyRecord> dependencies;
    std::unordered_map<std::string, uint64_t> child_counters;
  };

  // Row keys used for write-set validation.
  static std::string IssueKey(const std::string& id);
  static std::string LabelsKey(const std::string& id);
  static std::string CounterKey(const std::string& parent_id);
  static std::string DependencyRowKey(const model::DependencyKey& key);
  static constexpr const char* kGraphKey = "graph";

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;

  // commit version at which each row key was last written
  std::unordered_map<std::string, uint64_t> row_versions_;

  // creation order is not transactional; gaps after rollback are fine
  std::atomic<uint64_t> next_seq_{1};
};

}
