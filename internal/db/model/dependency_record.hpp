#pragma once

#include <cstdint>
#include <string>

#include "internal/model/dependency_type.hpp"

namespace issueflow::db::model {

/*
  Uniqueness key of an edge. Two edges between the same ordered pair with
  different types are distinct rows.
*/
struct DependencyKey {
  std::string                      from_id;
  std::string                      to_id;
  issueflow::model::DependencyType type = issueflow::model::DependencyType::kBlocks;

  bool operator==(const DependencyKey&) const = default;
  bool operator<(const DependencyKey& other) const {
    if (from_id != other.from_id) return from_id < other.from_id;
    if (to_id != other.to_id) return to_id < other.to_id;
    return type < other.type;
  }
};

/*
  Typed dependency edge.

    from ---(type)---> to

  blocks:       from cannot start until to is closed
  parent-child: from is a child of to
*/
struct DependencyRecord {
  std::string                      from_id;
  std::string                      to_id;
  issueflow::model::DependencyType type = issueflow::model::DependencyType::kBlocks;

  uint64_t created_at_ms = 0;

  // free-form annotation, e.g. the context pack of a self-reported blocker
  std::string note;

  DependencyKey Key() const {
    return DependencyKey{.from_id = from_id, .to_id = to_id, .type = type};
  }
};

} // namespace issueflow::db::model
