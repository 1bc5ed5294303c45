#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace issueflow::model {

inline constexpr std::string_view kTypeBug     = "bug";
inline constexpr std::string_view kTypeFeature = "feature";
inline constexpr std::string_view kTypeTask    = "task";
inline constexpr std::string_view kTypeEpic    = "epic";
inline constexpr std::string_view kTypeChore   = "chore";

inline constexpr int kMinPriority     = 0;
inline constexpr int kMaxPriority     = 4;
inline constexpr int kDefaultPriority = 2;

// True for the built-in types or any of the configured custom types.
bool IsKnownIssueType(std::string_view type, const std::vector<std::string>& custom_types);

} // namespace issueflow::model
