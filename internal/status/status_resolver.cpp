#include "internal/status/status_resolver.hpp"

#include "internal/model/issue_type.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace issueflow::status {

using issueflow::model::IssueStatus;

std::string_view ToString(EffectiveStatus status) {
  switch (status) {
    case EffectiveStatus::kReady:
      return "ready";
    case EffectiveStatus::kBlocked:
      return "blocked";
    case EffectiveStatus::kDeferred:
      return "deferred";
    case EffectiveStatus::kInProgress:
      return "in_progress";
    case EffectiveStatus::kClosed:
      return "closed";
  }
  return "unknown";
}

StatusResolver::StatusResolver(std::shared_ptr<const graph::DependencyGraph> graph) : graph_(std::move(graph)) {
}

Resolution StatusResolver::Resolve(db::Repository& repo, db::Transaction& tx, const db::model::IssueRecord& issue, std::uint64_t now_ms) const {
  Resolution resolution;
  switch (issue.status) {
    case IssueStatus::kClosed:
      resolution.effective = EffectiveStatus::kClosed;
      return resolution;
    case IssueStatus::kDeferred:
      resolution.effective = EffectiveStatus::kDeferred;
      return resolution;
    case IssueStatus::kInProgress:
      resolution.effective = EffectiveStatus::kInProgress;
      resolution.blockers  = graph_->BlockingEdges(repo, tx, issue.id);
      return resolution;
    case IssueStatus::kOpen:
      break;
  }

  resolution.blockers = graph_->BlockingEdges(repo, tx, issue.id);
  if (!resolution.blockers.empty()) {
    resolution.effective = EffectiveStatus::kBlocked;
  } else if (IsDeferredView(issue, now_ms)) {
    resolution.effective = EffectiveStatus::kDeferred;
  } else {
    resolution.effective = EffectiveStatus::kReady;
  }
  return resolution;
}

bool StatusResolver::IsDeferredView(const db::model::IssueRecord& issue, std::uint64_t now_ms) {
  if (issue.status == IssueStatus::kDeferred) {
    return true;
  }
  return issue.status == IssueStatus::kOpen && issue.defer_until_ms > now_ms;
}

IssueStatus StatusResolver::ParsePersistedStatus(std::string_view value) {
  const auto parsed = model::ParseIssueStatus(util::Trim(value));
  if (!parsed) {
    throw util::ValidationError("invalid status '" + std::string(value) + "': expected open, in_progress, deferred or closed");
  }
  return *parsed;
}

std::string StatusResolver::ValidateTitle(std::string_view title) {
  auto trimmed = util::Trim(title);
  if (trimmed.empty()) {
    throw util::ValidationError("title must not be empty");
  }
  return trimmed;
}

std::string StatusResolver::ValidateLabel(std::string_view label) {
  auto trimmed = util::Trim(label);
  if (trimmed.empty()) {
    throw util::ValidationError("label must not be empty");
  }
  return trimmed;
}

void StatusResolver::ValidatePriority(int priority) {
  if (priority < model::kMinPriority || priority > model::kMaxPriority) {
    throw util::ValidationError("priority " + std::to_string(priority) + " out of range 0..4");
  }
}

void StatusResolver::ValidateType(std::string_view type, const std::vector<std::string>& custom_types) {
  if (!model::IsKnownIssueType(type, custom_types)) {
    throw util::ValidationError("unknown issue type '" + std::string(type) + "'");
  }
}

void StatusResolver::ValidateRecord(const db::model::IssueRecord& record, const std::vector<std::string>& custom_types) {
  if (record.id.empty()) {
    throw util::ValidationError("issue id must not be empty");
  }
  ValidateTitle(record.title);
  ValidatePriority(record.priority);
  ValidateType(record.issue_type, custom_types);
}

void StatusResolver::ValidateTransition(const db::model::IssueRecord& record, IssueStatus to) {
  if (!model::CanTransition(record.status, to)) {
    throw util::PolicyViolation("issue " + record.id + " cannot move from " + std::string(model::ToString(record.status)) + " to " +
                                std::string(model::ToString(to)));
  }
}

void StatusResolver::ApplyReopen(db::model::IssueRecord& record, std::uint64_t now_ms) {
  record.status         = IssueStatus::kOpen;
  record.defer_until_ms = 0;
  record.closed_at_ms   = 0;
  record.close_reason.clear();
  record.verification.clear();
  record.updated_at_ms = now_ms;
}

} // namespace issueflow::status
