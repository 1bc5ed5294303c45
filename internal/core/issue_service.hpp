#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/graph/dependency_graph.hpp"
#include "internal/status/status_resolver.hpp"
#include "service_context.hpp"

namespace issueflow::core {

struct CreateIssueRequest {
  // explicit id; generated when empty (ignored when parent_id is set)
  std::string id;

  std::string title;
  std::string description;
  std::string notes;
  std::string metadata_json;

  std::string issue_type = "task";
  int         priority   = model::kDefaultPriority;
  std::string status     = "open";
  std::string assignee;

  std::string              parent_id;
  std::vector<std::string> blocked_by;
  std::string              discovered_from;
  std::vector<std::string> labels;
};

// Unset fields are left untouched.
struct IssueUpdate {
  std::optional<std::string>   title;
  std::optional<std::string>   description;
  std::optional<std::string>   notes;
  std::optional<std::string>   metadata_json;
  std::optional<std::string>   issue_type;
  std::optional<int>           priority;
  std::optional<std::string>   status;
  std::optional<std::string>   assignee;
  std::optional<std::uint64_t> defer_until_ms;

  // replaces the whole label set
  std::optional<std::vector<std::string>> labels;
};

struct IssueDetails {
  db::model::IssueRecord   issue;
  std::vector<std::string> labels;
  status::Resolution       resolution;

  std::optional<std::string>               parent_id;
  std::vector<db::model::DependencyRecord> dependencies;
  std::vector<db::model::DependencyRecord> dependents;
};

/*
  IssueService

  Plain CRUD and linking over the store. Every public call runs in its own
  transaction and either commits everything or nothing; the *InTx variants
  let the flow controller compose them into a larger transaction.

  Failures are thrown as util exceptions (see internal/util/errors.hpp).
*/
class IssueService {
 public:
  explicit IssueService(ServiceContext ctx);

  db::model::IssueRecord Create(const CreateIssueRequest& req);
  db::model::IssueRecord CreateInTx(db::Transaction& tx, const CreateIssueRequest& req);

  db::model::IssueRecord Update(const std::string& id, const IssueUpdate& update);

  void Link(const std::string& from, const std::string& to, model::DependencyType type, const std::string& note = {});
  void LinkInTx(db::Transaction& tx, const std::string& from, const std::string& to, model::DependencyType type, const std::string& note);

  void Unlink(const std::string& from, const std::string& to, model::DependencyType type);

  // Moves child under new_parent ("" detaches it).
  void Reparent(const std::string& child_id, const std::string& new_parent_id);

  // until_ms == 0 defers without a date.
  db::model::IssueRecord Defer(const std::string& id, std::uint64_t until_ms);
  db::model::IssueRecord Undefer(const std::string& id);

  db::model::IssueRecord Reopen(const std::string& id, const std::string& reason);

  void Delete(const std::string& id);

  void                     AddLabel(const std::string& id, const std::string& label);
  void                     RemoveLabel(const std::string& id, const std::string& label);
  std::vector<std::string> Labels(const std::string& id);

  IssueDetails Show(const std::string& id);

  std::vector<db::model::IssueRecord> List(const db::IssueFilter& filter);
  std::vector<db::model::IssueRecord> Ready(const graph::ReadyQuery& query);
  std::vector<graph::BlockedIssue>    Blocked();
  std::vector<db::model::IssueRecord> DeferredView();
  std::vector<graph::TreeNode>        Tree(const std::string& root_id, const graph::TreeOptions& options);
  std::vector<graph::EpicProgress>    EpicsEligibleForClosure();

 private:
  db::model::IssueRecord RequireIssue(db::Transaction& tx, const std::string& id);
  std::string            AllocateId(db::Transaction& tx, const CreateIssueRequest& req);
  void                   InsertEdge(db::Transaction& tx, db::model::DependencyRecord edge);

  ServiceContext ctx_;
};

} // namespace issueflow::core
