#include "issue_type.hpp"

#include <algorithm>

namespace issueflow::model {

bool IsKnownIssueType(std::string_view type, const std::vector<std::string>& custom_types) {
  if (type == kTypeBug || type == kTypeFeature || type == kTypeTask || type == kTypeEpic || type == kTypeChore) {
    return true;
  }
  return std::find(custom_types.begin(), custom_types.end(), type) != custom_types.end();
}

} // namespace issueflow::model
