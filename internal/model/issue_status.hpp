#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace issueflow::model {

/*
  Persisted issue status.

  This is a closed set. "ready" and "blocked" are derived views computed by
  the status resolver and are never stored.
*/
enum class IssueStatus : std::uint8_t {
  kOpen       = 0,
  kInProgress = 1,
  kDeferred   = 2,
  kClosed     = 3,
};

std::string_view ToString(IssueStatus status);

// Accepts only the four persisted spellings ("open", "in_progress", "deferred", "closed").
std::optional<IssueStatus> ParseIssueStatus(std::string_view value);

} // namespace issueflow::model
