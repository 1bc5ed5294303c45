#include "internal/core/issue_service.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using issueflow::core::CreateIssueRequest;
using issueflow::core::IssueUpdate;
using issueflow::model::DependencyType;
using issueflow::model::IssueStatus;

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

issueflow::factory::RuntimeDependencies BuildEngine() {
  auto config = issueflow::config::ConfigLoader::Defaults();
  config.mutable_issues()->add_custom_types("spike");
  return issueflow::factory::BuildWithRepository(config, std::make_shared<issueflow::db::memory::MemoryRepository>());
}

CreateIssueRequest Request(const std::string& id, const std::string& title = "work item") {
  CreateIssueRequest req;
  req.id    = id;
  req.title = title;
  return req;
}

std::vector<std::string> ReadyIds(issueflow::core::IssueService& service) {
  std::vector<std::string> ids;
  for (const auto& issue : service.Ready(issueflow::graph::ReadyQuery{})) {
    ids.push_back(issue.id);
  }
  return ids;
}

void CloseDirectly(issueflow::core::IssueService& service, const std::string& id) {
  IssueUpdate update;
  update.status = "closed";
  service.Update(id, update);
}

void TestCreateGeneratesPrefixedIds() {
  auto deps = BuildEngine();

  CreateIssueRequest req;
  req.title = "  generated  ";
  const auto issue = deps.issue_service->Create(req);
  assert(issue.id.rfind("if-", 0) == 0);
  assert(issue.id.size() == 9);
  assert(issue.title == "generated");
  assert(issue.status == IssueStatus::kOpen);

  assert(Throws<issueflow::util::AlreadyExists>([&] {
    auto dup = Request(issue.id);
    deps.issue_service->Create(dup);
  }));
}

void TestCreateRejectsInvalidInput() {
  auto deps = BuildEngine();

  assert(Throws<issueflow::util::ValidationError>([&] { deps.issue_service->Create(Request("a", " ")); }));

  auto bad_priority     = Request("b");
  bad_priority.priority = 7;
  assert(Throws<issueflow::util::ValidationError>([&] { deps.issue_service->Create(bad_priority); }));

  auto bad_status   = Request("c");
  bad_status.status = "ready";
  assert(Throws<issueflow::util::ValidationError>([&] { deps.issue_service->Create(bad_status); }));

  auto custom       = Request("d");
  custom.issue_type = "spike";
  assert(deps.issue_service->Create(custom).issue_type == "spike");

  auto missing_blocker       = Request("e");
  missing_blocker.blocked_by = {"nope"};
  assert(Throws<issueflow::util::NotFound>([&] { deps.issue_service->Create(missing_blocker); }));

  // nothing from the failed create is left behind
  assert(deps.issue_service->List(issueflow::db::IssueFilter{}).size() == 1);
}

void TestChildIdsFollowParent() {
  auto deps = BuildEngine();
  deps.issue_service->Create(Request("epic"));

  auto child      = Request("");
  child.parent_id = "epic";
  const auto c1   = deps.issue_service->Create(child);
  const auto c2   = deps.issue_service->Create(child);
  assert(c1.id == "epic.1");
  assert(c2.id == "epic.2");

  const auto details = deps.issue_service->Show("epic.2");
  assert(details.parent_id == std::optional<std::string>("epic"));
}

void TestChainClosesInOrder() {
  auto deps = BuildEngine();
  deps.issue_service->Create(Request("a"));
  for (const auto* pair : {"b:a", "c:b", "d:c"}) {
    const std::string edge(pair);
    auto              req = Request(edge.substr(0, 1));
    req.blocked_by        = {edge.substr(2, 1)};
    deps.issue_service->Create(req);
  }

  for (const auto* id : {"a", "b", "c", "d"}) {
    assert((ReadyIds(*deps.issue_service) == std::vector<std::string>{id}));
    CloseDirectly(*deps.issue_service, id);
  }
  assert(ReadyIds(*deps.issue_service).empty());
}

void TestLinkRejectsCyclesAndSecondParent() {
  auto deps = BuildEngine();
  for (const auto* id : {"a", "b", "c", "p", "q"}) {
    deps.issue_service->Create(Request(id));
  }
  deps.issue_service->Link("a", "b", DependencyType::kBlocks);
  deps.issue_service->Link("b", "c", DependencyType::kBlocks);

  assert(Throws<issueflow::util::CycleDetected>([&] { deps.issue_service->Link("c", "a", DependencyType::kBlocks); }));
  assert(Throws<issueflow::util::CycleDetected>([&] { deps.issue_service->Link("a", "a", DependencyType::kBlocks); }));
  assert(Throws<issueflow::util::ValidationError>([&] { deps.issue_service->Link("a", "a", DependencyType::kRelated); }));
  assert(Throws<issueflow::util::AlreadyExists>([&] { deps.issue_service->Link("a", "b", DependencyType::kBlocks); }));

  // a loop of informational edges is fine
  deps.issue_service->Link("c", "a", DependencyType::kRelated);

  deps.issue_service->Link("a", "p", DependencyType::kParentChild);
  assert(Throws<issueflow::util::PolicyViolation>([&] { deps.issue_service->Link("a", "q", DependencyType::kParentChild); }));

  deps.issue_service->Reparent("a", "q");
  assert(deps.issue_service->Show("a").parent_id == std::optional<std::string>("q"));
  deps.issue_service->Reparent("a", "");
  assert(!deps.issue_service->Show("a").parent_id.has_value());

  deps.issue_service->Unlink("a", "b", DependencyType::kBlocks);
  assert(Throws<issueflow::util::NotFound>([&] { deps.issue_service->Unlink("a", "b", DependencyType::kBlocks); }));
}

void TestUpdateAndLabels() {
  auto deps = BuildEngine();
  auto req  = Request("a");
  req.labels = {"backend", " api ", "backend"};
  deps.issue_service->Create(req);
  assert((deps.issue_service->Labels("a") == std::vector<std::string>{"api", "backend"}));

  IssueUpdate update;
  update.title    = "renamed";
  update.priority = 0;
  update.labels   = std::vector<std::string>{"frontend"};
  const auto updated = deps.issue_service->Update("a", update);
  assert(updated.title == "renamed");
  assert(updated.priority == 0);
  assert((deps.issue_service->Labels("a") == std::vector<std::string>{"frontend"}));

  deps.issue_service->AddLabel("a", "urgent");
  deps.issue_service->RemoveLabel("a", "frontend");
  assert((deps.issue_service->Labels("a") == std::vector<std::string>{"urgent"}));

  IssueUpdate bad;
  bad.priority = 9;
  assert(Throws<issueflow::util::ValidationError>([&] { deps.issue_service->Update("a", bad); }));
  assert(Throws<issueflow::util::NotFound>([&] { deps.issue_service->Update("missing", update); }));
}

void TestDeferAndReopen() {
  auto deps = BuildEngine();
  deps.issue_service->Create(Request("a"));
  deps.issue_service->Create(Request("b"));

  deps.issue_service->Defer("a", issueflow::util::NowMs() + 3'600'000);
  assert((ReadyIds(*deps.issue_service) == std::vector<std::string>{"b"}));
  assert(deps.issue_service->DeferredView().size() == 1);

  deps.issue_service->Undefer("a");
  assert(ReadyIds(*deps.issue_service).size() == 2);
  assert(Throws<issueflow::util::PolicyViolation>([&] { deps.issue_service->Undefer("a"); }));

  assert(Throws<issueflow::util::PolicyViolation>([&] { deps.issue_service->Reopen("a", "not closed"); }));

  CloseDirectly(*deps.issue_service, "a");
  const auto reopened = deps.issue_service->Reopen("a", "regressed");
  assert(reopened.status == IssueStatus::kOpen);
  assert(reopened.closed_at_ms == 0);
  assert(reopened.notes == "Reopened: regressed");
  assert(ReadyIds(*deps.issue_service).size() == 2);

  IssueUpdate illegal;
  illegal.status = "in_progress";
  CloseDirectly(*deps.issue_service, "a");
  assert(Throws<issueflow::util::PolicyViolation>([&] { deps.issue_service->Update("a", illegal); }));
}

void TestReopenKeepsFieldsFromSameUpdate() {
  auto deps = BuildEngine();
  deps.issue_service->Create(Request("a"));
  CloseDirectly(*deps.issue_service, "a");

  const auto until = issueflow::util::NowMs() + 3'600'000;
  IssueUpdate update;
  update.status         = "open";
  update.defer_until_ms = until;
  update.assignee       = "carol";
  const auto reopened = deps.issue_service->Update("a", update);

  assert(reopened.status == IssueStatus::kOpen);
  assert(reopened.closed_at_ms == 0);
  assert(reopened.close_reason.empty());
  assert(reopened.defer_until_ms == until);
  assert(reopened.assignee == "carol");

  const auto stored = deps.issue_service->Show("a").issue;
  assert(stored.defer_until_ms == until);
  assert(ReadyIds(*deps.issue_service).empty());
  assert(deps.issue_service->DeferredView().size() == 1);

  // without an explicit date the reopen still clears the old one
  CloseDirectly(*deps.issue_service, "a");
  IssueUpdate plain;
  plain.status = "open";
  assert(deps.issue_service->Update("a", plain).defer_until_ms == 0);
}

void TestDeleteCascadesEdges() {
  auto deps = BuildEngine();
  deps.issue_service->Create(Request("a"));
  auto b       = Request("b");
  b.blocked_by = {"a"};
  deps.issue_service->Create(b);
  assert(deps.issue_service->Blocked().size() == 1);

  deps.issue_service->Delete("a");
  assert(deps.issue_service->Blocked().empty());
  assert(deps.issue_service->Show("b").dependencies.empty());
  assert(Throws<issueflow::util::NotFound>([&] { deps.issue_service->Delete("a"); }));
}

void TestTreeAndEpics() {
  auto deps  = BuildEngine();
  auto epic  = Request("epic");
  epic.issue_type = "epic";
  deps.issue_service->Create(epic);

  auto child      = Request("");
  child.parent_id = "epic";
  deps.issue_service->Create(child);

  issueflow::graph::TreeOptions up;
  up.direction     = issueflow::graph::TreeDirection::kUp;
  const auto nodes = deps.issue_service->Tree("epic", up);
  assert(nodes.size() == 2);
  assert(nodes[1].issue.id == "epic.1");
  assert(nodes[1].edge_type == DependencyType::kParentChild);

  assert(Throws<issueflow::util::NotFound>([&] { deps.issue_service->Tree("missing", up); }));

  assert(deps.issue_service->EpicsEligibleForClosure().empty());
  CloseDirectly(*deps.issue_service, "epic.1");
  assert(deps.issue_service->EpicsEligibleForClosure().size() == 1);
}

} // namespace

int main() {
  TestCreateGeneratesPrefixedIds();
  TestCreateRejectsInvalidInput();
  TestChildIdsFollowParent();
  TestChainClosesInOrder();
  TestLinkRejectsCyclesAndSecondParent();
  TestUpdateAndLabels();
  TestDeferAndReopen();
  TestReopenKeepsFieldsFromSameUpdate();
  TestDeleteCascadesEdges();
  TestTreeAndEpics();

  std::cout << "issueflow_unit_issue_service: pass\n";
  return 0;
}
