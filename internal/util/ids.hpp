#pragma once

#include <cstdint>
#include <string>

namespace issueflow::util {

/*
  Issue identifier helpers

  Root issues:  <prefix>-<6 lowercase hex>     e.g. "if-3fa91c"
  Child issues: <parent id>.<n>                 e.g. "if-3fa91c.2"
*/

std::string GenerateIssueId(const std::string& prefix);

std::string ChildIssueId(const std::string& parent_id, uint64_t child_number);

} // namespace issueflow::util
