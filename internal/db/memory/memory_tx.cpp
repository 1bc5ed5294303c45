#include "memory_tx.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace issueflow::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_; // snapshot copy
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::TouchIssue(const std::string& id) {
  written_issues_.insert(id);
  Touch(MemoryRepository::IssueKey(id));
}

void MemoryTransaction::TouchLabels(const std::string& id) {
  written_labels_.insert(id);
  Touch(MemoryRepository::LabelsKey(id));
}

void MemoryTransaction::TouchCounter(const std::string& parent_id) {
  written_counters_.insert(parent_id);
  Touch(MemoryRepository::CounterKey(parent_id));
}

void MemoryTransaction::TouchDependency(const model::DependencyKey& key) {
  written_dependencies_.insert(key);
  Touch(MemoryRepository::DependencyRowKey(key));
  Touch(MemoryRepository::kGraphKey);
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("memory transaction already finished");
  }

  std::scoped_lock lock(repo_.mutex_);
  for (const auto& key : written_) {
    auto it = repo_.row_versions_.find(key);
    if (it != repo_.row_versions_.end() && it->second > snapshot_version_) {
      rolled_back_ = true;
      throw util::Conflict("transaction conflict: row " + key + " was modified by a concurrent transaction");
    }
  }

  ApplyWrites();

  repo_.committed_version_++;
  for (const auto& key : written_) {
    repo_.row_versions_[key] = repo_.committed_version_;
  }
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

void MemoryTransaction::ApplyWrites() {
  auto& target = repo_.committed_;

  for (const auto& id : written_issues_) {
    auto it = working_.issues.find(id);
    if (it == working_.issues.end()) {
      target.issues.erase(id);
    } else {
      target.issues[id] = it->second;
    }
  }

  for (const auto& id : written_labels_) {
    auto it = working_.labels.find(id);
    if (it == working_.labels.end()) {
      target.labels.erase(id);
    } else {
      target.labels[id] = it->second;
    }
  }

  for (const auto& parent_id : written_counters_) {
    target.child_counters[parent_id] = working_.child_counters[parent_id];
  }

  for (const auto& key : written_dependencies_) {
    auto it = working_.dependencies.find(key);
    if (it == working_.dependencies.end()) {
      target.dependencies.erase(key);
    } else {
      target.dependencies[key] = it->second;
    }
  }
}

} // namespace issueflow::db::memory
