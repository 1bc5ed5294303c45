#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/dependency_type.hpp"

namespace issueflow::graph {

/*
  DependencyGraph

  Stateless query layer over the edge set held by db::Repository. Every
  call reads through the caller's transaction, so a flow operation that
  checks and then writes sees one consistent view.

  Edge direction is always from -> to:
    blocks        from waits on to
    parent-child  from is a child of to

  Walks are iterative with an explicit visited set; nothing here recurses
  on graph depth.
*/

enum class TreeDirection : std::uint8_t {
  kDown, // follow outgoing edges (what the root waits on, its parent chain)
  kUp,   // follow incoming edges (what waits on the root, its children)
};

struct TreeNode {
  db::model::IssueRecord issue;

  std::uint32_t depth = 0;

  // node whose expansion emitted this one ("" for the root)
  std::string parent_id;

  // edge that connected parent_id to this node (unset for the root)
  std::optional<model::DependencyType> edge_type;

  // reached again through another path; listed but not expanded
  bool already_shown = false;

  // depth bound reached while the node still had neighbours
  bool truncated = false;
};

struct TreeOptions {
  TreeDirection direction = TreeDirection::kDown;

  std::uint32_t max_depth = 50;

  std::vector<model::DependencyType> edge_types = {model::DependencyType::kBlocks, model::DependencyType::kParentChild};
};

struct ReadyQuery {
  std::optional<std::string> parent_id;
  std::optional<int>         priority;

  // every label listed must be present
  std::vector<std::string> labels;

  bool unassigned_only = false;

  // 0 = unlimited
  std::size_t limit = 0;
};

struct BlockedIssue {
  db::model::IssueRecord   issue;
  std::vector<std::string> blocker_ids;
};

struct EpicProgress {
  db::model::IssueRecord issue;
  std::size_t            total_children  = 0;
  std::size_t            closed_children = 0;
};

class DependencyGraph {
 public:
  // open, not deferred into the future, no blocking edge to a non-closed issue
  bool IsReady(db::Repository& repo, db::Transaction& tx, const db::model::IssueRecord& issue, std::uint64_t now_ms) const;

  // Outgoing blocking edges whose target is not closed.
  std::vector<db::model::DependencyRecord> BlockingEdges(db::Repository& repo, db::Transaction& tx, const std::string& issue_id) const;

  // True if inserting from -(type)-> to would close a cycle among edges of
  // the same type. Self edges are always rejected; informational types never
  // form constrained cycles.
  bool WouldCreateCycle(db::Repository& repo, db::Transaction& tx, const std::string& from, const std::string& to,
                        model::DependencyType type) const;

  // Same walk as WouldCreateCycle, returning the closing path
  // [from, to, ..., from] when one exists.
  std::optional<std::vector<std::string>> FindCyclePath(db::Repository& repo, db::Transaction& tx, const std::string& from,
                                                        const std::string& to, model::DependencyType type) const;

  // Pre-order listing rooted at root_id. Empty if root does not exist.
  std::vector<TreeNode> BuildTree(db::Repository& repo, db::Transaction& tx, const std::string& root_id, const TreeOptions& options) const;

  // Ready issues ordered by (priority, seq).
  std::vector<db::model::IssueRecord> ReadySet(db::Repository& repo, db::Transaction& tx, const ReadyQuery& query, std::uint64_t now_ms) const;

  // Open issues with at least one unresolved blocker, in creation order.
  std::vector<BlockedIssue> BlockedSet(db::Repository& repo, db::Transaction& tx) const;

  std::vector<db::model::IssueRecord> Children(db::Repository& repo, db::Transaction& tx, const std::string& parent_id) const;

  std::optional<std::string> ParentOf(db::Repository& repo, db::Transaction& tx, const std::string& child_id) const;

  // Open issues that waited on closed_id and have no blocker left. Call after
  // closed_id has been closed in the same transaction.
  std::vector<std::string> NewlyUnblockedBy(db::Repository& repo, db::Transaction& tx, const std::string& closed_id) const;

  // Non-closed epics with at least one child, all children closed.
  std::vector<EpicProgress> EpicsEligibleForClosure(db::Repository& repo, db::Transaction& tx) const;
};

} // namespace issueflow::graph
