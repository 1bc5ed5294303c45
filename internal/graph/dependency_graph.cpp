#include "internal/graph/dependency_graph.hpp"

#include <algorithm>
#include <map>
#include <queue>
#include <set>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace issueflow::graph {

using db::model::DependencyRecord;
using db::model::IssueRecord;
using issueflow::model::DependencyType;
using issueflow::model::IssueStatus;

namespace {

bool IsClosed(db::Repository& repo, db::Transaction& tx, const std::string& id) {
  const auto issue = repo.GetIssue(tx, id);
  // a dangling target cannot exist (edges cascade); treat it as resolved
  return !issue.has_value() || issue->status == IssueStatus::kClosed;
}

bool HasAllLabels(db::Repository& repo, db::Transaction& tx, const std::string& id, const std::vector<std::string>& required) {
  if (required.empty()) {
    return true;
  }
  const auto labels = repo.GetLabels(tx, id);
  for (const auto& label : required) {
    if (std::find(labels.begin(), labels.end(), label) == labels.end()) {
      return false;
    }
  }
  return true;
}

} // namespace

bool DependencyGraph::IsReady(db::Repository& repo, db::Transaction& tx, const IssueRecord& issue, std::uint64_t now_ms) const {
  if (issue.status != IssueStatus::kOpen) {
    return false;
  }
  if (issue.defer_until_ms != 0 && issue.defer_until_ms > now_ms) {
    return false;
  }
  return BlockingEdges(repo, tx, issue.id).empty();
}

std::vector<DependencyRecord> DependencyGraph::BlockingEdges(db::Repository& repo, db::Transaction& tx, const std::string& issue_id) const {
  std::vector<DependencyRecord> blocking;
  for (auto& edge : repo.GetDependencies(tx, issue_id)) {
    if (!issueflow::model::IsBlocking(edge.type)) {
      continue;
    }
    if (!IsClosed(repo, tx, edge.to_id)) {
      blocking.push_back(std::move(edge));
    }
  }
  return blocking;
}

bool DependencyGraph::WouldCreateCycle(db::Repository& repo, db::Transaction& tx, const std::string& from, const std::string& to,
                                       DependencyType type) const {
  if (from == to) {
    return true;
  }
  if (!issueflow::model::IsCycleConstrained(type)) {
    return false;
  }
  return FindCyclePath(repo, tx, from, to, type).has_value();
}

std::optional<std::vector<std::string>> DependencyGraph::FindCyclePath(db::Repository& repo, db::Transaction& tx, const std::string& from,
                                                                       const std::string& to, DependencyType type) const {
  if (from == to) {
    return std::vector<std::string>{from, to};
  }
  if (!issueflow::model::IsCycleConstrained(type)) {
    return std::nullopt;
  }

  // BFS from `to` along existing edges of the same type; reaching `from`
  // means the new edge would close the loop.
  std::unordered_map<std::string, std::string> reached_via;
  std::queue<std::string>                      pending;

  reached_via.emplace(to, "");
  pending.push(to);

  while (!pending.empty()) {
    const auto node = pending.front();
    pending.pop();

    for (const auto& edge : repo.GetDependencies(tx, node)) {
      if (edge.type != type) {
        continue;
      }
      if (!reached_via.emplace(edge.to_id, node).second) {
        continue;
      }

      if (edge.to_id == from) {
        std::vector<std::string> reversed;
        for (std::string cursor = from; !cursor.empty(); cursor = reached_via[cursor]) {
          reversed.push_back(cursor);
        }
        std::vector<std::string> path{from};
        path.insert(path.end(), reversed.rbegin(), reversed.rend());
        return path;
      }
      pending.push(edge.to_id);
    }
  }

  return std::nullopt;
}

std::vector<TreeNode> DependencyGraph::BuildTree(db::Repository& repo, db::Transaction& tx, const std::string& root_id,
                                                 const TreeOptions& options) const {
  // neighbour id -> first followed edge type, ordered by id for stable output
  using Neighbours = std::map<std::string, DependencyType>;

  struct Reached {
    IssueRecord   issue;
    std::uint32_t depth = 0;
    std::string   parent_id;
    Neighbours    neighbours;
  };

  struct Pending {
    std::string                   id;
    std::uint32_t                 depth = 0;
    std::string                   parent_id;
    std::optional<DependencyType> edge_type;
  };

  const std::set<DependencyType> followed(options.edge_types.begin(), options.edge_types.end());
  const bool                     down = options.direction == TreeDirection::kDown;

  auto neighbours_of = [&](const std::string& id) {
    Neighbours neighbours;
    const auto edges = down ? repo.GetDependencies(tx, id) : repo.GetDependents(tx, id);
    for (const auto& edge : edges) {
      if (!followed.contains(edge.type)) {
        continue;
      }
      const auto& next = down ? edge.to_id : edge.from_id;
      auto [it, inserted] = neighbours.emplace(next, edge.type);
      if (!inserted && edge.type < it->second) {
        it->second = edge.type;
      }
    }
    return neighbours;
  };

  auto root = repo.GetIssue(tx, root_id);
  if (!root) {
    return {};
  }

  // Level-order pass: each node keeps the shallowest depth it is reachable
  // at and the first parent reaching it there, so the depth bound never
  // hides a node that a shorter path brings within range.
  std::unordered_map<std::string, Reached> reached;
  std::queue<std::string>                  frontier;
  reached.emplace(root_id, Reached{.issue = std::move(*root), .neighbours = neighbours_of(root_id)});
  frontier.push(root_id);

  while (!frontier.empty()) {
    const auto id = frontier.front();
    frontier.pop();

    const auto& current = reached.at(id);
    if (current.depth >= options.max_depth) {
      continue;
    }
    for (const auto& [next, type] : current.neighbours) {
      if (reached.contains(next)) {
        continue;
      }
      auto issue = repo.GetIssue(tx, next);
      if (!issue) {
        continue;
      }
      reached.emplace(next, Reached{.issue = std::move(*issue), .depth = current.depth + 1, .parent_id = id, .neighbours = neighbours_of(next)});
      frontier.push(next);
    }
  }

  // Pre-order listing. A node is expanded once, under the parent recorded
  // above; every other occurrence is listed as already shown.
  std::vector<TreeNode> nodes;
  std::vector<Pending>  stack;
  stack.push_back(Pending{.id = root_id});

  while (!stack.empty()) {
    auto current = std::move(stack.back());
    stack.pop_back();

    const auto& entry = reached.at(current.id);

    TreeNode node;
    node.issue     = entry.issue;
    node.depth     = current.depth;
    node.parent_id = current.parent_id;
    node.edge_type = current.edge_type;

    if (current.parent_id != entry.parent_id || current.depth != entry.depth) {
      node.already_shown = true;
      nodes.push_back(std::move(node));
      continue;
    }

    if (entry.depth >= options.max_depth) {
      node.truncated = !entry.neighbours.empty();
      nodes.push_back(std::move(node));
      continue;
    }
    nodes.push_back(std::move(node));

    // reverse push so the smallest id is expanded first
    for (auto it = entry.neighbours.rbegin(); it != entry.neighbours.rend(); ++it) {
      if (!reached.contains(it->first)) {
        continue;
      }
      stack.push_back(Pending{.id = it->first, .depth = current.depth + 1, .parent_id = current.id, .edge_type = it->second});
    }
  }

  return nodes;
}

std::vector<IssueRecord> DependencyGraph::ReadySet(db::Repository& repo, db::Transaction& tx, const ReadyQuery& query,
                                                   std::uint64_t now_ms) const {
  db::IssueFilter filter;
  filter.status   = IssueStatus::kOpen;
  filter.priority = query.priority;
  if (query.unassigned_only) {
    filter.assignee = std::string();
  }

  std::vector<IssueRecord> ready;
  for (auto& issue : repo.ListIssues(tx, filter)) {
    if (!IsReady(repo, tx, issue, now_ms)) {
      continue;
    }
    if (query.parent_id && ParentOf(repo, tx, issue.id) != query.parent_id) {
      continue;
    }
    if (!HasAllLabels(repo, tx, issue.id, query.labels)) {
      continue;
    }
    ready.push_back(std::move(issue));
  }

  std::stable_sort(ready.begin(), ready.end(), [](const IssueRecord& a, const IssueRecord& b) {
    if (a.priority != b.priority) return a.priority < b.priority;
    return a.seq < b.seq;
  });

  if (query.limit > 0 && ready.size() > query.limit) {
    ready.resize(query.limit);
  }
  return ready;
}

std::vector<BlockedIssue> DependencyGraph::BlockedSet(db::Repository& repo, db::Transaction& tx) const {
  db::IssueFilter filter;
  filter.status = IssueStatus::kOpen;

  std::vector<BlockedIssue> blocked;
  for (auto& issue : repo.ListIssues(tx, filter)) {
    const auto edges = BlockingEdges(repo, tx, issue.id);
    if (edges.empty()) {
      continue;
    }
    BlockedIssue entry;
    entry.issue = std::move(issue);
    for (const auto& edge : edges) {
      entry.blocker_ids.push_back(edge.to_id);
    }
    blocked.push_back(std::move(entry));
  }
  return blocked;
}

std::vector<IssueRecord> DependencyGraph::Children(db::Repository& repo, db::Transaction& tx, const std::string& parent_id) const {
  std::vector<IssueRecord> children;
  for (const auto& edge : repo.GetDependents(tx, parent_id)) {
    if (!issueflow::model::IsHierarchical(edge.type)) {
      continue;
    }
    if (auto child = repo.GetIssue(tx, edge.from_id)) {
      children.push_back(std::move(*child));
    }
  }
  std::sort(children.begin(), children.end(), [](const IssueRecord& a, const IssueRecord& b) { return a.seq < b.seq; });
  return children;
}

std::optional<std::string> DependencyGraph::ParentOf(db::Repository& repo, db::Transaction& tx, const std::string& child_id) const {
  for (const auto& edge : repo.GetDependencies(tx, child_id)) {
    if (issueflow::model::IsHierarchical(edge.type)) {
      return edge.to_id;
    }
  }
  return std::nullopt;
}

std::vector<std::string> DependencyGraph::NewlyUnblockedBy(db::Repository& repo, db::Transaction& tx, const std::string& closed_id) const {
  std::vector<std::pair<std::uint64_t, std::string>> unblocked;
  std::unordered_set<std::string>                    seen;

  for (const auto& edge : repo.GetDependents(tx, closed_id)) {
    if (!issueflow::model::IsBlocking(edge.type) || !seen.insert(edge.from_id).second) {
      continue;
    }
    const auto waiter = repo.GetIssue(tx, edge.from_id);
    if (!waiter || waiter->status != IssueStatus::kOpen) {
      continue;
    }
    if (BlockingEdges(repo, tx, waiter->id).empty()) {
      unblocked.emplace_back(waiter->seq, waiter->id);
    }
  }

  std::sort(unblocked.begin(), unblocked.end());
  std::vector<std::string> ids;
  ids.reserve(unblocked.size());
  for (auto& [_, id] : unblocked) {
    ids.push_back(std::move(id));
  }
  return ids;
}

std::vector<EpicProgress> DependencyGraph::EpicsEligibleForClosure(db::Repository& repo, db::Transaction& tx) const {
  db::IssueFilter filter;
  filter.issue_type = std::string(issueflow::model::kTypeEpic);

  std::vector<EpicProgress> eligible;
  for (auto& epic : repo.ListIssues(tx, filter)) {
    if (epic.status == IssueStatus::kClosed) {
      continue;
    }
    const auto children = Children(repo, tx, epic.id);
    if (children.empty()) {
      continue;
    }
    const auto closed = static_cast<std::size_t>(std::count_if(children.begin(), children.end(), [](const IssueRecord& child) {
      return child.status == IssueStatus::kClosed;
    }));
    if (closed == children.size()) {
      eligible.push_back(EpicProgress{.issue = std::move(epic), .total_children = children.size(), .closed_children = closed});
    }
  }
  return eligible;
}

} // namespace issueflow::graph
