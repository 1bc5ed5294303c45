#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/dependency_record.hpp"
#include "internal/db/model/issue_record.hpp"

namespace issueflow::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - CompareAndSetStatus never overwrites a row whose (status, assignee)
    moved since the caller read it
  - InsertDependency is insert-if-absent on (from, to, type); a second
    type on the same pair is a new row, never an update

  The DB is the source of truth for:
    issues
    labels
    dependency edges
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Issues
  // ---------------------------------------------------------------------

  // Assigns record.seq and sets record.version to 1.
  virtual Result InsertIssue(Transaction&, model::IssueRecord&) = 0;

  virtual std::optional<model::IssueRecord> GetIssue(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::IssueRecord> ListIssues(Transaction&, const IssueFilter&) = 0;

  // Optimistic full-row update: record.version is the version the caller read.
  // Stores version + 1 on success, Conflict if the row moved.
  virtual Result UpdateIssue(Transaction&, const model::IssueRecord&) = 0;

  // Cascades labels and every edge touching the issue.
  virtual Result DeleteIssue(Transaction&, const std::string& id) = 0;

  virtual Result CompareAndSetStatus(Transaction&, const StatusTransition&) = 0;

  // Next free child ordinal under parent_id (1, 2, ...).
  virtual uint64_t AllocateChildNumber(Transaction&, const std::string& parent_id) = 0;

  // ---------------------------------------------------------------------
  // Labels
  // ---------------------------------------------------------------------

  virtual Result AddLabel(Transaction&, const std::string& issue_id, const std::string& label) = 0;

  virtual Result RemoveLabel(Transaction&, const std::string& issue_id, const std::string& label) = 0;

  virtual std::vector<std::string> GetLabels(Transaction&, const std::string& issue_id) = 0;

  // ---------------------------------------------------------------------
  // Dependencies
  // ---------------------------------------------------------------------

  virtual Result InsertDependency(Transaction&, const model::DependencyRecord&) = 0;

  virtual Result DeleteDependency(Transaction&, const model::DependencyKey&) = 0;

  // Outgoing edges of issue_id (issue_id is "from").
  virtual std::vector<model::DependencyRecord> GetDependencies(Transaction&, const std::string& issue_id) = 0;

  // Incoming edges of issue_id (issue_id is "to").
  virtual std::vector<model::DependencyRecord> GetDependents(Transaction&, const std::string& issue_id) = 0;

  // Serialises cycle checks with edge inserts for the rest of the transaction.
  virtual Result LockDependencyGraph(Transaction&) = 0;
};

} // namespace issueflow::db
