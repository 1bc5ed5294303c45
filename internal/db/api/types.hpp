#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/issue_status.hpp"

namespace issueflow::db {

/*
  Predicate for ListIssues. Unset fields match everything.
  Results are always ordered by creation sequence.
*/
struct IssueFilter {
  std::optional<issueflow::model::IssueStatus> status;
  std::optional<std::string>                   assignee;
  std::optional<std::string>                   issue_type;
  std::optional<int>                           priority;

  // 0 = unlimited
  std::size_t limit = 0;
};

/*
  Compare-and-set on (status, assignee).

  Applied only if the stored row still has expected_status and
  expected_assignee. Moving to closed stamps closed_at/close_reason/
  verification; moving away from closed clears them.
*/
struct StatusTransition {
  std::string id;

  issueflow::model::IssueStatus expected_status = issueflow::model::IssueStatus::kOpen;
  std::string                   expected_assignee;

  issueflow::model::IssueStatus new_status = issueflow::model::IssueStatus::kOpen;
  std::string                   new_assignee;

  std::string close_reason;
  std::string verification;

  // replaces notes when set
  std::optional<std::string> notes;

  uint64_t at_ms = 0;
};

} // namespace issueflow::db
