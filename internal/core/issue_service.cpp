#include "issue_service.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"

namespace issueflow::core {

using db::model::DependencyRecord;
using db::model::IssueRecord;
using issueflow::model::DependencyType;
using issueflow::model::IssueStatus;
using status::StatusResolver;

namespace {

constexpr int kMaxIdAttempts = 8;

std::vector<std::string> NormalizeLabels(const std::vector<std::string>& labels) {
  std::set<std::string> unique;
  for (const auto& label : labels) {
    unique.insert(StatusResolver::ValidateLabel(label));
  }
  return {unique.begin(), unique.end()};
}

} // namespace

IssueService::IssueService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

IssueRecord IssueService::RequireIssue(db::Transaction& tx, const std::string& id) {
  auto issue = ctx_.repository->GetIssue(tx, id);
  if (!issue) {
    throw util::NotFound("issue " + id + " not found");
  }
  return *issue;
}

std::string IssueService::AllocateId(db::Transaction& tx, const CreateIssueRequest& req) {
  if (!req.parent_id.empty()) {
    RequireIssue(tx, req.parent_id);
    return util::ChildIssueId(req.parent_id, ctx_.repository->AllocateChildNumber(tx, req.parent_id));
  }

  if (!req.id.empty()) {
    if (ctx_.repository->GetIssue(tx, req.id)) {
      throw util::AlreadyExists("issue " + req.id + " already exists");
    }
    return req.id;
  }

  // check before inserting: a failed INSERT aborts a postgres transaction
  for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
    auto id = util::GenerateIssueId(ctx_.policy.prefix);
    if (!ctx_.repository->GetIssue(tx, id)) {
      return id;
    }
  }
  throw std::runtime_error("could not allocate a free issue id with prefix " + ctx_.policy.prefix);
}

void IssueService::InsertEdge(db::Transaction& tx, DependencyRecord edge) {
  if (edge.from_id == edge.to_id) {
    if (issueflow::model::IsCycleConstrained(edge.type)) {
      throw util::CycleDetected("issue " + edge.from_id + " cannot " + std::string(issueflow::model::ToString(edge.type)) + " itself");
    }
    throw util::ValidationError("self-referencing " + std::string(issueflow::model::ToString(edge.type)) + " edge on " + edge.from_id);
  }

  ThrowIfDbError(ctx_.repository->LockDependencyGraph(tx), "lock dependency graph");

  if (issueflow::model::IsHierarchical(edge.type)) {
    const auto parent = ctx_.graph->ParentOf(*ctx_.repository, tx, edge.from_id);
    if (parent && *parent != edge.to_id) {
      throw util::PolicyViolation("issue " + edge.from_id + " already has parent " + *parent + "; reparent instead");
    }
  }

  if (auto path = ctx_.graph->FindCyclePath(*ctx_.repository, tx, edge.from_id, edge.to_id, edge.type)) {
    throw util::CycleDetected("adding " + edge.from_id + " -(" + std::string(issueflow::model::ToString(edge.type)) + ")-> " + edge.to_id +
                              " would create a cycle: " + util::Join(*path, " -> "));
  }

  if (edge.created_at_ms == 0) {
    edge.created_at_ms = util::NowMs();
  }
  ThrowIfDbError(ctx_.repository->InsertDependency(tx, edge), "insert dependency");
}

// ------------------------------------------------------------------
// Create
// ------------------------------------------------------------------

IssueRecord IssueService::Create(const CreateIssueRequest& req) {
  auto tx     = ctx_.repository->Begin();
  auto record = CreateInTx(*tx, req);
  tx->Commit();

  ISSUEFLOW_LOG_INFO("issue created", {observability::IssueField(record.id), observability::StringField("type", record.issue_type),
                                       observability::IntField("priority", record.priority)});
  return record;
}

IssueRecord IssueService::CreateInTx(db::Transaction& tx, const CreateIssueRequest& req) {
  const auto now = util::NowMs();

  IssueRecord record;
  record.title         = StatusResolver::ValidateTitle(req.title);
  record.description   = req.description;
  record.notes         = req.notes;
  record.metadata_json = req.metadata_json;
  record.issue_type    = util::Trim(req.issue_type);
  record.priority      = req.priority;
  record.status        = StatusResolver::ParsePersistedStatus(req.status);
  record.assignee      = util::Trim(req.assignee);
  record.created_at_ms = now;
  record.updated_at_ms = now;
  if (record.status == IssueStatus::kClosed) {
    record.closed_at_ms = now;
  }

  StatusResolver::ValidatePriority(record.priority);
  StatusResolver::ValidateType(record.issue_type, ctx_.policy.custom_types);
  const auto labels = NormalizeLabels(req.labels);

  record.id = AllocateId(tx, req);
  StatusResolver::ValidateRecord(record, ctx_.policy.custom_types);

  ThrowIfDbError(ctx_.repository->InsertIssue(tx, record), "insert issue");

  for (const auto& label : labels) {
    ThrowIfDbError(ctx_.repository->AddLabel(tx, record.id, label), "add label");
  }

  if (!req.parent_id.empty()) {
    InsertEdge(tx, DependencyRecord{.from_id = record.id, .to_id = req.parent_id, .type = DependencyType::kParentChild, .created_at_ms = now});
  }

  std::set<std::string> blockers;
  for (const auto& blocker : req.blocked_by) {
    auto trimmed = util::Trim(blocker);
    if (trimmed.empty() || !blockers.insert(trimmed).second) {
      continue;
    }
    RequireIssue(tx, trimmed);
    InsertEdge(tx, DependencyRecord{.from_id = record.id, .to_id = trimmed, .type = DependencyType::kBlocks, .created_at_ms = now});
  }

  if (!req.discovered_from.empty()) {
    RequireIssue(tx, req.discovered_from);
    InsertEdge(tx,
               DependencyRecord{.from_id = record.id, .to_id = req.discovered_from, .type = DependencyType::kDiscoveredFrom, .created_at_ms = now});
  }

  return record;
}

// ------------------------------------------------------------------
// Update
// ------------------------------------------------------------------

IssueRecord IssueService::Update(const std::string& id, const IssueUpdate& update) {
  auto tx     = ctx_.repository->Begin();
  auto record = RequireIssue(*tx, id);
  const auto now = util::NowMs();

  // status first: a reopen clears defer_until_ms, which the caller may set in the same update
  if (update.status) {
    const auto target = StatusResolver::ParsePersistedStatus(*update.status);
    StatusResolver::ValidateTransition(record, target);
    if (record.status == IssueStatus::kClosed && target != IssueStatus::kClosed) {
      StatusResolver::ApplyReopen(record, now);
    } else if (target == IssueStatus::kClosed && record.status != IssueStatus::kClosed) {
      record.closed_at_ms = now;
    }
    record.status = target;
  }

  if (update.title) record.title = StatusResolver::ValidateTitle(*update.title);
  if (update.description) record.description = *update.description;
  if (update.notes) record.notes = *update.notes;
  if (update.metadata_json) record.metadata_json = *update.metadata_json;
  if (update.issue_type) record.issue_type = util::Trim(*update.issue_type);
  if (update.priority) record.priority = *update.priority;
  if (update.assignee) record.assignee = util::Trim(*update.assignee);
  if (update.defer_until_ms) record.defer_until_ms = *update.defer_until_ms;

  StatusResolver::ValidateRecord(record, ctx_.policy.custom_types);
  record.updated_at_ms = now;

  std::vector<std::string> labels;
  if (update.labels) {
    labels = NormalizeLabels(*update.labels);
  }

  ThrowIfDbError(ctx_.repository->UpdateIssue(*tx, record), "update issue");

  if (update.labels) {
    for (const auto& existing : ctx_.repository->GetLabels(*tx, id)) {
      if (std::find(labels.begin(), labels.end(), existing) == labels.end()) {
        ThrowIfDbError(ctx_.repository->RemoveLabel(*tx, id, existing), "remove label");
      }
    }
    for (const auto& label : labels) {
      ThrowIfDbError(ctx_.repository->AddLabel(*tx, id, label), "add label");
    }
  }

  tx->Commit();
  record.version++;
  return record;
}

// ------------------------------------------------------------------
// Links
// ------------------------------------------------------------------

void IssueService::Link(const std::string& from, const std::string& to, DependencyType type, const std::string& note) {
  auto tx = ctx_.repository->Begin();
  LinkInTx(*tx, from, to, type, note);
  tx->Commit();

  ISSUEFLOW_LOG_INFO("dependency added", {observability::StringField("from", from), observability::StringField("to", to),
                                          observability::StringField("type", issueflow::model::ToString(type))});
}

void IssueService::LinkInTx(db::Transaction& tx, const std::string& from, const std::string& to, DependencyType type, const std::string& note) {
  RequireIssue(tx, from);
  RequireIssue(tx, to);
  InsertEdge(tx, DependencyRecord{.from_id = from, .to_id = to, .type = type, .note = note});
}

void IssueService::Unlink(const std::string& from, const std::string& to, DependencyType type) {
  auto tx = ctx_.repository->Begin();
  ThrowIfDbError(ctx_.repository->LockDependencyGraph(*tx), "lock dependency graph");
  ThrowIfDbError(ctx_.repository->DeleteDependency(*tx, db::model::DependencyKey{.from_id = from, .to_id = to, .type = type}), "remove dependency");
  tx->Commit();
}

void IssueService::Reparent(const std::string& child_id, const std::string& new_parent_id) {
  auto tx = ctx_.repository->Begin();
  RequireIssue(*tx, child_id);
  if (!new_parent_id.empty()) {
    RequireIssue(*tx, new_parent_id);
  }

  ThrowIfDbError(ctx_.repository->LockDependencyGraph(*tx), "lock dependency graph");
  for (const auto& edge : ctx_.repository->GetDependencies(*tx, child_id)) {
    if (issueflow::model::IsHierarchical(edge.type)) {
      ThrowIfDbError(ctx_.repository->DeleteDependency(*tx, edge.Key()), "remove old parent");
    }
  }

  if (!new_parent_id.empty()) {
    InsertEdge(*tx, DependencyRecord{.from_id = child_id, .to_id = new_parent_id, .type = DependencyType::kParentChild});
  }
  tx->Commit();

  ISSUEFLOW_LOG_INFO("issue reparented", {observability::IssueField(child_id), observability::StringField("parent_id", new_parent_id)});
}

// ------------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------------

IssueRecord IssueService::Defer(const std::string& id, std::uint64_t until_ms) {
  auto tx     = ctx_.repository->Begin();
  auto record = RequireIssue(*tx, id);
  StatusResolver::ValidateTransition(record, IssueStatus::kDeferred);

  record.status         = IssueStatus::kDeferred;
  record.defer_until_ms = until_ms;
  record.updated_at_ms  = util::NowMs();
  ThrowIfDbError(ctx_.repository->UpdateIssue(*tx, record), "defer issue");
  tx->Commit();
  record.version++;
  return record;
}

IssueRecord IssueService::Undefer(const std::string& id) {
  auto tx     = ctx_.repository->Begin();
  auto record = RequireIssue(*tx, id);
  if (record.status != IssueStatus::kDeferred && record.defer_until_ms == 0) {
    throw util::PolicyViolation("issue " + id + " is not deferred");
  }
  if (record.status == IssueStatus::kDeferred) {
    record.status = IssueStatus::kOpen;
  }
  record.defer_until_ms = 0;
  record.updated_at_ms  = util::NowMs();
  ThrowIfDbError(ctx_.repository->UpdateIssue(*tx, record), "undefer issue");
  tx->Commit();
  record.version++;
  return record;
}

IssueRecord IssueService::Reopen(const std::string& id, const std::string& reason) {
  auto tx     = ctx_.repository->Begin();
  auto record = RequireIssue(*tx, id);
  if (record.status != IssueStatus::kClosed) {
    throw util::PolicyViolation("issue " + id + " is not closed");
  }

  StatusResolver::ApplyReopen(record, util::NowMs());
  const auto trimmed = util::Trim(reason);
  if (!trimmed.empty()) {
    record.notes = util::AppendNotesLine(record.notes, "Reopened: " + trimmed);
  }
  ThrowIfDbError(ctx_.repository->UpdateIssue(*tx, record), "reopen issue");
  tx->Commit();
  record.version++;

  ISSUEFLOW_LOG_INFO("issue reopened", {observability::IssueField(id)});
  return record;
}

void IssueService::Delete(const std::string& id) {
  auto tx = ctx_.repository->Begin();
  ThrowIfDbError(ctx_.repository->LockDependencyGraph(*tx), "lock dependency graph");
  ThrowIfDbError(ctx_.repository->DeleteIssue(*tx, id), "delete issue");
  tx->Commit();

  ISSUEFLOW_LOG_INFO("issue deleted", {observability::IssueField(id)});
}

// ------------------------------------------------------------------
// Labels
// ------------------------------------------------------------------

void IssueService::AddLabel(const std::string& id, const std::string& label) {
  const auto trimmed = StatusResolver::ValidateLabel(label);
  auto       tx      = ctx_.repository->Begin();
  RequireIssue(*tx, id);
  ThrowIfDbError(ctx_.repository->AddLabel(*tx, id, trimmed), "add label");
  tx->Commit();
}

void IssueService::RemoveLabel(const std::string& id, const std::string& label) {
  const auto trimmed = StatusResolver::ValidateLabel(label);
  auto       tx      = ctx_.repository->Begin();
  RequireIssue(*tx, id);
  ThrowIfDbError(ctx_.repository->RemoveLabel(*tx, id, trimmed), "remove label");
  tx->Commit();
}

std::vector<std::string> IssueService::Labels(const std::string& id) {
  auto tx = ctx_.repository->Begin();
  RequireIssue(*tx, id);
  auto labels = ctx_.repository->GetLabels(*tx, id);
  tx->Commit();
  return labels;
}

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

IssueDetails IssueService::Show(const std::string& id) {
  auto tx = ctx_.repository->Begin();

  IssueDetails details;
  details.issue        = RequireIssue(*tx, id);
  details.labels       = ctx_.repository->GetLabels(*tx, id);
  details.resolution   = ctx_.resolver->Resolve(*ctx_.repository, *tx, details.issue, util::NowMs());
  details.parent_id    = ctx_.graph->ParentOf(*ctx_.repository, *tx, id);
  details.dependencies = ctx_.repository->GetDependencies(*tx, id);
  details.dependents   = ctx_.repository->GetDependents(*tx, id);

  tx->Commit();
  return details;
}

std::vector<IssueRecord> IssueService::List(const db::IssueFilter& filter) {
  auto tx     = ctx_.repository->Begin();
  auto issues = ctx_.repository->ListIssues(*tx, filter);
  tx->Commit();
  return issues;
}

std::vector<IssueRecord> IssueService::Ready(const graph::ReadyQuery& query) {
  auto tx    = ctx_.repository->Begin();
  auto ready = ctx_.graph->ReadySet(*ctx_.repository, *tx, query, util::NowMs());
  tx->Commit();
  return ready;
}

std::vector<graph::BlockedIssue> IssueService::Blocked() {
  auto tx      = ctx_.repository->Begin();
  auto blocked = ctx_.graph->BlockedSet(*ctx_.repository, *tx);
  tx->Commit();
  return blocked;
}

std::vector<IssueRecord> IssueService::DeferredView() {
  const auto now = util::NowMs();
  auto       tx  = ctx_.repository->Begin();

  std::vector<IssueRecord> deferred;
  for (auto& issue : ctx_.repository->ListIssues(*tx, db::IssueFilter{})) {
    if (StatusResolver::IsDeferredView(issue, now)) {
      deferred.push_back(std::move(issue));
    }
  }
  tx->Commit();
  return deferred;
}

std::vector<graph::TreeNode> IssueService::Tree(const std::string& root_id, const graph::TreeOptions& options) {
  auto tx = ctx_.repository->Begin();
  RequireIssue(*tx, root_id);
  auto nodes = ctx_.graph->BuildTree(*ctx_.repository, *tx, root_id, options);
  tx->Commit();
  return nodes;
}

std::vector<graph::EpicProgress> IssueService::EpicsEligibleForClosure() {
  auto tx    = ctx_.repository->Begin();
  auto epics = ctx_.graph->EpicsEligibleForClosure(*ctx_.repository, *tx);
  tx->Commit();
  return epics;
}

} // namespace issueflow::core
