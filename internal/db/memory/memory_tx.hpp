#pragma once

#include <set>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace issueflow::db::memory {

/*
  Transaction = snapshot + write set
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  // Mutable() must be paired with Touch() for every row written.
  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

  void Touch(std::string row_key) {
    written_.insert(std::move(row_key));
  }

  void TouchIssue(const std::string& id);
  void TouchLabels(const std::string& id);
  void TouchCounter(const std::string& parent_id);
  void TouchDependency(const model::DependencyKey& key);

 private:
  void ApplyWrites();

  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                snapshot_version_ = 0;

  std::set<std::string>               written_;
  std::set<std::string>               written_issues_;
  std::set<std::string>               written_labels_;
  std::set<std::string>               written_counters_;
  std::set<model::DependencyKey>      written_dependencies_;

  bool committed_   = false;
  bool rolled_back_ = false;
};

} // namespace issueflow::db::memory
