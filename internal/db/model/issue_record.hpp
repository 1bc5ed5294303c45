#pragma once

#include <cstdint>
#include <string>

#include "internal/model/issue_status.hpp"
#include "internal/model/issue_type.hpp"

namespace issueflow::db::model {

/*
  Persistent issue row.

  IMPORTANT:
  - status only ever holds one of the four persisted values.
  - version is the optimistic concurrency counter; every write bumps it.
  - seq is assigned by the backend on insert and gives total creation order.
*/

struct IssueRecord {
  std::string id;

  std::string title;
  std::string description;
  std::string notes;

  // opaque JSON object text ("" = none)
  std::string metadata_json;

  std::string issue_type = std::string(issueflow::model::kTypeTask);
  int         priority   = issueflow::model::kDefaultPriority;

  issueflow::model::IssueStatus status = issueflow::model::IssueStatus::kOpen;
  std::string                   assignee;

  // 0 = not deferred
  uint64_t defer_until_ms = 0;

  std::string close_reason;
  std::string verification;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
  uint64_t closed_at_ms  = 0;

  uint64_t seq     = 0;
  uint64_t version = 0;
};

} // namespace issueflow::db::model
