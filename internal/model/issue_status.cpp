#include "issue_status.hpp"

namespace issueflow::model {

std::string_view ToString(IssueStatus status) {
  switch (status) {
    case IssueStatus::kOpen:
      return "open";
    case IssueStatus::kInProgress:
      return "in_progress";
    case IssueStatus::kDeferred:
      return "deferred";
    case IssueStatus::kClosed:
      return "closed";
  }
  return "open";
}

std::optional<IssueStatus> ParseIssueStatus(std::string_view value) {
  if (value == "open") return IssueStatus::kOpen;
  if (value == "in_progress") return IssueStatus::kInProgress;
  if (value == "deferred") return IssueStatus::kDeferred;
  if (value == "closed") return IssueStatus::kClosed;
  return std::nullopt;
}

} // namespace issueflow::model
