#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/graph/dependency_graph.hpp"

namespace issueflow::status {

/*
  Derived view of an issue.

  Only the four persisted statuses are ever stored. ready, blocked and the
  open-but-deferred case are computed here and nowhere else.
*/
enum class EffectiveStatus : std::uint8_t {
  kReady,
  kBlocked,
  kDeferred,
  kInProgress,
  kClosed,
};

std::string_view ToString(EffectiveStatus status);

struct Resolution {
  EffectiveStatus                          effective = EffectiveStatus::kReady;
  std::vector<db::model::DependencyRecord> blockers;
};

class StatusResolver {
 public:
  explicit StatusResolver(std::shared_ptr<const graph::DependencyGraph> graph);

  Resolution Resolve(db::Repository& repo, db::Transaction& tx, const db::model::IssueRecord& issue, std::uint64_t now_ms) const;

  // status deferred, or open with defer_until in the future
  static bool IsDeferredView(const db::model::IssueRecord& issue, std::uint64_t now_ms);

  // Throws util::ValidationError for anything but the four persisted values.
  static model::IssueStatus ParsePersistedStatus(std::string_view value);

  // Return the trimmed value; throw util::ValidationError if it is empty.
  static std::string ValidateTitle(std::string_view title);
  static std::string ValidateLabel(std::string_view label);

  static void ValidatePriority(int priority);
  static void ValidateType(std::string_view type, const std::vector<std::string>& custom_types);

  // Full-row check run before every issue write.
  static void ValidateRecord(const db::model::IssueRecord& record, const std::vector<std::string>& custom_types);

  // Throws util::PolicyViolation if the state machine forbids from -> to.
  static void ValidateTransition(const db::model::IssueRecord& record, model::IssueStatus to);

  // Reopen leaves the issue open with no defer date and no close stamps,
  // so it shows up in the open and ready views.
  static void ApplyReopen(db::model::IssueRecord& record, std::uint64_t now_ms);

 private:
  std::shared_ptr<const graph::DependencyGraph> graph_;
};

} // namespace issueflow::status
