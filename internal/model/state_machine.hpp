#pragma once

#include "internal/model/issue_status.hpp"

namespace issueflow::model {

constexpr bool IsTerminal(IssueStatus status) {
  return status == IssueStatus::kClosed;
}

/*
  open        -> in_progress | deferred | closed
  in_progress -> open | deferred | closed
  deferred    -> open | closed
  closed      -> open            (reopen)
*/
constexpr bool CanTransition(IssueStatus from, IssueStatus to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return to == IssueStatus::kOpen;
  }
  if (from == IssueStatus::kDeferred) {
    return to == IssueStatus::kOpen || to == IssueStatus::kClosed;
  }
  return true;
}

} // namespace issueflow::model
