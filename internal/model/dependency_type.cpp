#include "dependency_type.hpp"

#include <array>
#include <utility>

namespace issueflow::model {

namespace {

constexpr std::array<std::pair<DependencyType, std::string_view>, 10> kNames = {{
    {DependencyType::kBlocks, "blocks"},
    {DependencyType::kParentChild, "parent-child"},
    {DependencyType::kCausedBy, "caused-by"},
    {DependencyType::kValidates, "validates"},
    {DependencyType::kTracks, "tracks"},
    {DependencyType::kRelatesTo, "relates-to"},
    {DependencyType::kRelated, "related"},
    {DependencyType::kDiscoveredFrom, "discovered-from"},
    {DependencyType::kSupersedes, "supersedes"},
    {DependencyType::kDuplicateOf, "duplicate-of"},
}};

} // namespace

std::string_view ToString(DependencyType type) {
  for (const auto& [candidate, name] : kNames) {
    if (candidate == type) return name;
  }
  return "blocks";
}

std::optional<DependencyType> ParseDependencyType(std::string_view value) {
  for (const auto& [type, name] : kNames) {
    if (name == value) return type;
  }
  return std::nullopt;
}

} // namespace issueflow::model
