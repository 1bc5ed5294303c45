#include "internal/graph/dependency_graph.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/time.hpp"

namespace {

using issueflow::db::memory::MemoryRepository;
using issueflow::db::model::DependencyRecord;
using issueflow::db::model::IssueRecord;
using issueflow::graph::DependencyGraph;
using issueflow::graph::ReadyQuery;
using issueflow::graph::TreeDirection;
using issueflow::graph::TreeOptions;
using issueflow::model::DependencyType;
using issueflow::model::IssueStatus;

struct Fixture {
  std::shared_ptr<MemoryRepository> repo = std::make_shared<MemoryRepository>();
  DependencyGraph                   graph;

  void Issue(const std::string& id, int priority = 2, IssueStatus status = IssueStatus::kOpen, const std::string& type = "task") {
    auto        tx = repo->Begin();
    IssueRecord record;
    record.id         = id;
    record.title      = id;
    record.priority   = priority;
    record.status     = status;
    record.issue_type = type;
    assert(repo->InsertIssue(*tx, record));
    tx->Commit();
  }

  void Edge(const std::string& from, const std::string& to, DependencyType type = DependencyType::kBlocks) {
    auto tx = repo->Begin();
    assert(repo->InsertDependency(*tx, DependencyRecord{.from_id = from, .to_id = to, .type = type}));
    tx->Commit();
  }

  void Close(const std::string& id) {
    auto tx     = repo->Begin();
    auto record = repo->GetIssue(*tx, id);
    record->status = IssueStatus::kClosed;
    assert(repo->UpdateIssue(*tx, *record));
    tx->Commit();
  }

  std::vector<std::string> ReadyIds(const ReadyQuery& query = {}) {
    auto                     tx = repo->Begin();
    std::vector<std::string> ids;
    for (const auto& issue : graph.ReadySet(*repo, *tx, query, issueflow::util::NowMs())) {
      ids.push_back(issue.id);
    }
    return ids;
  }
};

void TestBlockingChainReleasesInOrder() {
  Fixture f;
  f.Issue("a");
  f.Issue("b");
  f.Issue("c");
  f.Edge("b", "a");
  f.Edge("c", "b");

  assert((f.ReadyIds() == std::vector<std::string>{"a"}));
  f.Close("a");
  assert((f.ReadyIds() == std::vector<std::string>{"b"}));

  auto tx = f.repo->Begin();
  assert((f.graph.NewlyUnblockedBy(*f.repo, *tx, "a") == std::vector<std::string>{"b"}));
}

void TestNonBlockingTypesDoNotAffectReadiness() {
  Fixture f;
  f.Issue("a");
  f.Issue("b");
  f.Edge("a", "b", DependencyType::kRelated);
  f.Edge("a", "b", DependencyType::kCausedBy);
  f.Edge("a", "b", DependencyType::kDiscoveredFrom);
  f.Edge("a", "b", DependencyType::kTracks);

  assert((f.ReadyIds() == std::vector<std::string>{"a", "b"}));

  auto tx = f.repo->Begin();
  assert(f.graph.BlockingEdges(*f.repo, *tx, "a").empty());
  assert(f.graph.BlockedSet(*f.repo, *tx).empty());
}

void TestSamePairCarriesSeveralTypes() {
  Fixture f;
  f.Issue("a");
  f.Issue("b");
  f.Edge("a", "b", DependencyType::kBlocks);
  f.Edge("a", "b", DependencyType::kRelated);

  auto tx = f.repo->Begin();
  assert(f.repo->GetDependencies(*tx, "a").size() == 2);

  const auto blocked = f.graph.BlockedSet(*f.repo, *tx);
  assert(blocked.size() == 1);
  assert(blocked[0].issue.id == "a");
  assert((blocked[0].blocker_ids == std::vector<std::string>{"b"}));
}

void TestCycleDetectionPerType() {
  Fixture f;
  f.Issue("a");
  f.Issue("b");
  f.Issue("c");
  f.Edge("a", "b");
  f.Edge("b", "c");

  auto tx = f.repo->Begin();
  assert(f.graph.WouldCreateCycle(*f.repo, *tx, "a", "a", DependencyType::kBlocks));
  assert(f.graph.WouldCreateCycle(*f.repo, *tx, "c", "a", DependencyType::kBlocks));
  assert(!f.graph.WouldCreateCycle(*f.repo, *tx, "a", "c", DependencyType::kBlocks));

  // parent-child is checked against its own edges only
  assert(!f.graph.WouldCreateCycle(*f.repo, *tx, "c", "a", DependencyType::kParentChild));
  // informational edges may close loops
  assert(!f.graph.WouldCreateCycle(*f.repo, *tx, "c", "a", DependencyType::kRelated));

  const auto path = f.graph.FindCyclePath(*f.repo, *tx, "c", "a", DependencyType::kBlocks);
  assert(path.has_value());
  assert((*path == std::vector<std::string>{"c", "a", "b", "c"}));
}

void TestDiamondTreeListsSharedNodeOnce() {
  Fixture f;
  for (const auto* id : {"a", "b", "c", "d"}) {
    f.Issue(id);
  }
  f.Edge("a", "b");
  f.Edge("a", "c");
  f.Edge("b", "d");
  f.Edge("c", "d");

  auto       tx    = f.repo->Begin();
  const auto nodes = f.graph.BuildTree(*f.repo, *tx, "a", TreeOptions{});

  assert(nodes.size() == 5);
  assert(nodes[0].issue.id == "a" && nodes[0].depth == 0 && !nodes[0].edge_type);
  assert(nodes[1].issue.id == "b" && nodes[1].depth == 1 && nodes[1].parent_id == "a");
  assert(nodes[2].issue.id == "d" && nodes[2].depth == 2 && !nodes[2].already_shown && nodes[2].parent_id == "b");
  assert(nodes[3].issue.id == "c" && nodes[3].depth == 1);
  assert(nodes[4].issue.id == "d" && nodes[4].already_shown && nodes[4].parent_id == "c");

  std::set<std::string> distinct;
  for (const auto& node : nodes) {
    distinct.insert(node.issue.id);
  }
  assert(distinct.size() == 4);

  TreeOptions up;
  up.direction        = TreeDirection::kUp;
  const auto upstream = f.graph.BuildTree(*f.repo, *tx, "d", up);
  assert(upstream.size() == 5);
  assert(upstream[0].issue.id == "d");
  assert(upstream[2].issue.id == "a" && upstream[2].depth == 2);
  assert(upstream[4].issue.id == "a" && upstream[4].already_shown);
}

void TestTreeDepthBoundMarksTruncation() {
  Fixture f;
  f.Issue("a");
  f.Issue("b");
  f.Issue("c");
  f.Edge("a", "b");
  f.Edge("b", "c");

  TreeOptions options;
  options.max_depth = 1;

  auto       tx    = f.repo->Begin();
  const auto nodes = f.graph.BuildTree(*f.repo, *tx, "a", options);
  assert(nodes.size() == 2);
  assert(nodes[1].issue.id == "b");
  assert(nodes[1].truncated);

  assert(f.graph.BuildTree(*f.repo, *tx, "missing", options).empty());
}

void TestDepthBoundUsesShortestPath() {
  Fixture f;
  for (const auto* id : {"a", "b", "x", "y"}) {
    f.Issue(id);
  }
  f.Edge("a", "b");
  f.Edge("b", "x");
  f.Edge("x", "y");
  f.Edge("a", "x");

  TreeOptions options;
  options.max_depth = 2;

  auto       tx    = f.repo->Begin();
  const auto nodes = f.graph.BuildTree(*f.repo, *tx, "a", options);

  // x sits at depth 2 under b but at depth 1 under a; y must still appear
  assert(nodes.size() == 5);
  assert(nodes[1].issue.id == "b");
  assert(nodes[2].issue.id == "x" && nodes[2].parent_id == "b" && nodes[2].already_shown && !nodes[2].truncated);
  assert(nodes[3].issue.id == "x" && nodes[3].parent_id == "a" && nodes[3].depth == 1 && !nodes[3].already_shown);
  assert(nodes[4].issue.id == "y" && nodes[4].parent_id == "x" && nodes[4].depth == 2);
  assert(!nodes[4].truncated && !nodes[4].already_shown);
}

void TestReadyOrderingAndFilters() {
  Fixture f;
  f.Issue("low", 3);
  f.Issue("high", 0);
  f.Issue("mid", 1);
  f.Issue("deferred", 0, IssueStatus::kDeferred);
  f.Issue("busy", 0, IssueStatus::kInProgress);

  assert((f.ReadyIds() == std::vector<std::string>{"high", "mid", "low"}));

  {
    auto tx = f.repo->Begin();
    assert(f.repo->AddLabel(*tx, "low", "backend"));
    tx->Commit();
  }
  ReadyQuery labelled;
  labelled.labels = {"backend"};
  assert((f.ReadyIds(labelled) == std::vector<std::string>{"low"}));

  ReadyQuery limited;
  limited.limit = 1;
  assert((f.ReadyIds(limited) == std::vector<std::string>{"high"}));

  // open with a future defer date stays out of the ready set
  {
    auto tx                = f.repo->Begin();
    auto record            = f.repo->GetIssue(*tx, "high");
    record->defer_until_ms = issueflow::util::NowMs() + 3'600'000;
    assert(f.repo->UpdateIssue(*tx, *record));
    tx->Commit();
  }
  assert((f.ReadyIds() == std::vector<std::string>{"mid", "low"}));
}

void TestChildrenAndEpicEligibility() {
  Fixture f;
  f.Issue("epic", 1, IssueStatus::kOpen, "epic");
  f.Issue("epic.1");
  f.Issue("epic.2");
  f.Edge("epic.1", "epic", DependencyType::kParentChild);
  f.Edge("epic.2", "epic", DependencyType::kParentChild);

  ReadyQuery under_epic;
  under_epic.parent_id = "epic";
  assert((f.ReadyIds(under_epic) == std::vector<std::string>{"epic.1", "epic.2"}));

  {
    auto tx = f.repo->Begin();
    assert(f.graph.Children(*f.repo, *tx, "epic").size() == 2);
    assert(f.graph.ParentOf(*f.repo, *tx, "epic.1") == std::optional<std::string>("epic"));
    assert(f.graph.EpicsEligibleForClosure(*f.repo, *tx).empty());
  }

  f.Close("epic.1");
  f.Close("epic.2");

  auto       tx    = f.repo->Begin();
  const auto epics = f.graph.EpicsEligibleForClosure(*f.repo, *tx);
  assert(epics.size() == 1);
  assert(epics[0].issue.id == "epic");
  assert(epics[0].total_children == 2 && epics[0].closed_children == 2);
}

} // namespace

int main() {
  TestBlockingChainReleasesInOrder();
  TestNonBlockingTypesDoNotAffectReadiness();
  TestSamePairCarriesSeveralTypes();
  TestCycleDetectionPerType();
  TestDiamondTreeListsSharedNodeOnce();
  TestTreeDepthBoundMarksTruncation();
  TestDepthBoundUsesShortestPath();
  TestReadyOrderingAndFilters();
  TestChildrenAndEpicEligibility();

  std::cout << "issueflow_unit_dependency_graph: pass\n";
  return 0;
}
