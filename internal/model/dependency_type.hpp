#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace issueflow::model {

enum class DependencyType : std::uint8_t {
  kBlocks = 0,
  kParentChild,
  kCausedBy,
  kValidates,
  kTracks,
  kRelatesTo,
  kRelated,
  kDiscoveredFrom,
  kSupersedes,
  kDuplicateOf,
};

enum class DependencyClass : std::uint8_t {
  kBlocking,
  kHierarchical,
  kInformational,
};

constexpr DependencyClass ClassOf(DependencyType type) {
  switch (type) {
    case DependencyType::kBlocks:
      return DependencyClass::kBlocking;
    case DependencyType::kParentChild:
      return DependencyClass::kHierarchical;
    default:
      return DependencyClass::kInformational;
  }
}

// Gates readiness of the source while the target is not closed.
constexpr bool IsBlocking(DependencyType type) {
  return ClassOf(type) == DependencyClass::kBlocking;
}

constexpr bool IsHierarchical(DependencyType type) {
  return ClassOf(type) == DependencyClass::kHierarchical;
}

// Subgraphs of these types must stay acyclic; each type is checked only against its own edges.
constexpr bool IsCycleConstrained(DependencyType type) {
  return ClassOf(type) != DependencyClass::kInformational;
}

std::string_view ToString(DependencyType type);

std::optional<DependencyType> ParseDependencyType(std::string_view value);

} // namespace issueflow::model
