#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "api/issueflow/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/flow/flow_result.hpp"
#include "internal/model/dependency_type.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"

using issueflow::flow::ExitCode;
using issueflow::util::ParseInt;
using issueflow::util::ParseUnsigned;
using issueflow::v1::FlowEnvelope;

static void Usage() {
  std::cerr << "Usage:\n"
            << "  issueflowctl [--config <config.yaml>] <command> [args]\n"
            << "\n"
            << "Issues:\n"
            << "  create --title <t> [--type t] [--priority 0-4] [--parent id] [--blocked-by id]... [--label l]...\n"
            << "         [--description d] [--assignee a] [--discovered-from id]\n"
            << "  update <id> [--title t] [--status s] [--priority p] [--assignee a] [--notes n] [--type t]\n"
            << "  show <id>\n"
            << "  delete <id>\n"
            << "  label add|remove <id> <label>\n"
            << "  defer <id> [--until-ms <unix ms>]\n"
            << "  undefer <id>\n"
            << "  reopen <id> [--reason r]\n"
            << "\n"
            << "Graph:\n"
            << "  link <from> <to> [--type blocks] [--note n]\n"
            << "  unlink <from> <to> [--type blocks]\n"
            << "  reparent <child> <parent|->\n"
            << "  ready [--parent id] [--priority p] [--label l]... [--limit n]\n"
            << "  blocked\n"
            << "  deferred\n"
            << "  epics\n"
            << "  tree <id> [--direction down|up] [--max-depth n] [--type t]...\n"
            << "\n"
            << "Flow:\n"
            << "  claim-next --actor <a> [--limit n] [--parent id] [--priority p] [--label l]...\n"
            << "  close-safe <id> [--reason r] [--verified v]... [--force]\n"
            << "  block-with-context <id> --context-pack <text> [--blocker id]\n"
            << "      The issue goes back to open and keeps its assignee, so it can show up in\n"
            << "      `ready` while claim-next, which only takes unassigned issues, skips it.\n"
            << "      Release it for other agents with `update <id> --assignee=`.\n"
            << "  create-discovered <from-id> --title <t> [--type t] [--priority p] [--label l]...\n"
            << "  supersede <id> --by <id>... [--reason r]\n";
}

namespace {

/*
  Minimal flag parser: positionals plus repeatable --name value pairs.
  --name=value is accepted too. Only --force is a bare switch.
*/
class Args {
 public:
  Args(int argc, char** argv, int start) {
    for (int i = start; i < argc; ++i) {
      std::string token = argv[i];
      if (token.rfind("--", 0) != 0 || token == "--") {
        positionals_.push_back(token);
        continue;
      }
      token = token.substr(2);
      if (const auto eq = token.find('='); eq != std::string::npos) {
        flags_[token.substr(0, eq)].push_back(token.substr(eq + 1));
        continue;
      }
      if (token == "force") {
        flags_[token].push_back("true");
        continue;
      }
      if (i + 1 >= argc) {
        throw issueflow::util::ValidationError("flag --" + token + " needs a value");
      }
      flags_[token].push_back(argv[++i]);
    }
  }

  const std::string& Positional(size_t index, const char* name) const {
    if (index >= positionals_.size()) {
      throw issueflow::util::ValidationError(std::string("missing argument <") + name + ">");
    }
    return positionals_[index];
  }

  std::optional<std::string> Flag(const std::string& name) const {
    auto it = flags_.find(name);
    if (it == flags_.end()) return std::nullopt;
    return it->second.back();
  }

  std::vector<std::string> Flags(const std::string& name) const {
    auto it = flags_.find(name);
    if (it == flags_.end()) return {};
    return it->second;
  }

  bool Has(const std::string& name) const {
    return flags_.contains(name);
  }

 private:
  std::vector<std::string>                        positionals_;
  std::map<std::string, std::vector<std::string>> flags_;
};

issueflow::model::DependencyType ParseType(const std::optional<std::string>& value) {
  if (!value) return issueflow::model::DependencyType::kBlocks;
  auto parsed = issueflow::model::ParseDependencyType(*value);
  if (!parsed) {
    throw issueflow::util::ValidationError("unknown dependency type '" + *value + "'");
  }
  return *parsed;
}

issueflow::v1::IssueSummary ToSummary(const issueflow::db::model::IssueRecord& issue, std::string_view effective,
                                      const std::vector<std::string>& labels = {}) {
  issueflow::v1::IssueSummary summary;
  summary.set_id(issue.id);
  summary.set_title(issue.title);
  summary.set_status(std::string(issueflow::model::ToString(issue.status)));
  summary.set_effective(std::string(effective));
  summary.set_priority(issue.priority);
  summary.set_issue_type(issue.issue_type);
  summary.set_assignee(issue.assignee);
  summary.set_created_at(issueflow::util::FormatUnixMillis(issue.created_at_ms));
  summary.set_updated_at(issueflow::util::FormatUnixMillis(issue.updated_at_ms));
  summary.set_closed_at(issueflow::util::FormatUnixMillis(issue.closed_at_ms));
  for (const auto& label : labels) {
    summary.add_labels(label);
  }
  return summary;
}

FlowEnvelope OkEnvelope(const std::string& command, std::string_view result) {
  FlowEnvelope envelope;
  envelope.set_ok(true);
  envelope.set_command(command);
  envelope.set_result(std::string(result));
  envelope.set_exit_code(0);
  return envelope;
}

// Exceptions that escape a non-flow command get the same exit codes the
// flow taxonomy uses.
FlowEnvelope ExceptionEnvelope(const std::string& command, const std::exception& e) {
  using namespace issueflow::util;
  ExitCode code = ExitCode::kSystemError;
  if (dynamic_cast<const ValidationError*>(&e)) {
    code = ExitCode::kInvalidInput;
  } else if (dynamic_cast<const NotFound*>(&e) || dynamic_cast<const PolicyViolation*>(&e) || dynamic_cast<const AlreadyExists*>(&e)) {
    code = ExitCode::kPolicyViolation;
  } else if (dynamic_cast<const CycleDetected*>(&e)) {
    code = ExitCode::kPartialState;
  } else if (dynamic_cast<const StoreUnavailable*>(&e)) {
    code = ExitCode::kTransientFailure;
  } else if (dynamic_cast<const Conflict*>(&e)) {
    code = ExitCode::kConflict;
  }
  return issueflow::flow::ErrorEnvelope(command, code, e.what());
}

FlowEnvelope Dispatch(const std::string& cmd, const Args& args, const issueflow::factory::RuntimeDependencies& deps) {
  auto& issues = *deps.issue_service;
  auto& flow   = *deps.flow_controller;

  // ------------------------------------------------------------
  // Flow
  // ------------------------------------------------------------

  if (cmd == "claim-next") {
    issueflow::flow::ClaimRequest req;
    req.actor = args.Flag("actor").value_or("");
    if (auto limit = args.Flag("limit")) req.limit = static_cast<uint32_t>(ParseUnsigned(*limit, "limit", UINT32_MAX));
    req.parent_id = args.Flag("parent");
    if (auto priority = args.Flag("priority")) req.priority = ParseInt(*priority, "priority");
    req.labels = args.Flags("label");
    return issueflow::flow::ToEnvelope(cmd, flow.ClaimNext(req));
  }

  if (cmd == "close-safe") {
    issueflow::flow::CloseRequest req;
    req.issue_id = args.Positional(0, "id");
    req.reason   = args.Flag("reason").value_or("");
    req.verified = args.Flags("verified");
    req.force    = args.Has("force");
    return issueflow::flow::ToEnvelope(cmd, flow.CloseSafe(req));
  }

  if (cmd == "block-with-context") {
    issueflow::flow::BlockRequest req;
    req.issue_id     = args.Positional(0, "id");
    req.blocker_id   = args.Flag("blocker").value_or("");
    req.context_pack = args.Flag("context-pack").value_or("");
    return issueflow::flow::ToEnvelope(cmd, flow.BlockWithContext(req));
  }

  if (cmd == "create-discovered") {
    issueflow::flow::CreateDiscoveredRequest req;
    req.from_id          = args.Positional(0, "from-id");
    req.issue.title      = args.Flag("title").value_or("");
    req.issue.issue_type = args.Flag("type").value_or("task");
    if (auto priority = args.Flag("priority")) req.issue.priority = ParseInt(*priority, "priority");
    req.issue.labels      = args.Flags("label");
    req.issue.description = args.Flag("description").value_or("");
    return issueflow::flow::ToEnvelope(cmd, flow.CreateDiscovered(req));
  }

  if (cmd == "supersede") {
    issueflow::flow::SupersedeRequest req;
    req.issue_id        = args.Positional(0, "id");
    req.replacement_ids = args.Flags("by");
    req.reason          = args.Flag("reason").value_or("");
    return issueflow::flow::ToEnvelope(cmd, flow.Supersede(req));
  }

  // ------------------------------------------------------------
  // Issues
  // ------------------------------------------------------------

  if (cmd == "create") {
    issueflow::core::CreateIssueRequest req;
    req.title           = args.Flag("title").value_or("");
    req.description     = args.Flag("description").value_or("");
    req.issue_type      = args.Flag("type").value_or("task");
    req.assignee        = args.Flag("assignee").value_or("");
    req.status          = args.Flag("status").value_or("open");
    req.parent_id       = args.Flag("parent").value_or("");
    req.discovered_from = args.Flag("discovered-from").value_or("");
    req.blocked_by      = args.Flags("blocked-by");
    req.labels          = args.Flags("label");
    if (auto priority = args.Flag("priority")) req.priority = ParseInt(*priority, "priority");

    const auto record   = issues.Create(req);
    const auto details  = issues.Show(record.id);
    auto       envelope = OkEnvelope(cmd, "created");
    envelope.set_issue_id(record.id);
    *envelope.add_issues() = ToSummary(details.issue, issueflow::status::ToString(details.resolution.effective), details.labels);
    return envelope;
  }

  if (cmd == "update") {
    const auto&                  id = args.Positional(0, "id");
    issueflow::core::IssueUpdate update;
    update.title       = args.Flag("title");
    update.status      = args.Flag("status");
    update.assignee    = args.Flag("assignee");
    update.notes       = args.Flag("notes");
    update.issue_type  = args.Flag("type");
    update.description = args.Flag("description");
    if (auto priority = args.Flag("priority")) update.priority = ParseInt(*priority, "priority");
    if (args.Has("label")) update.labels = args.Flags("label");

    const auto record   = issues.Update(id, update);
    auto       envelope = OkEnvelope(cmd, "updated");
    envelope.set_issue_id(record.id);
    return envelope;
  }

  if (cmd == "show") {
    const auto details  = issues.Show(args.Positional(0, "id"));
    auto       envelope = OkEnvelope(cmd, "shown");
    envelope.set_issue_id(details.issue.id);
    *envelope.add_issues() = ToSummary(details.issue, issueflow::status::ToString(details.resolution.effective), details.labels);
    for (const auto& edge : details.resolution.blockers) {
      envelope.add_blocker_ids(edge.to_id);
    }
    return envelope;
  }

  if (cmd == "delete") {
    const auto& id = args.Positional(0, "id");
    issues.Delete(id);
    auto envelope = OkEnvelope(cmd, "deleted");
    envelope.set_issue_id(id);
    return envelope;
  }

  if (cmd == "label") {
    const auto& action = args.Positional(0, "add|remove");
    const auto& id     = args.Positional(1, "id");
    const auto& label  = args.Positional(2, "label");
    if (action == "add") {
      issues.AddLabel(id, label);
    } else if (action == "remove") {
      issues.RemoveLabel(id, label);
    } else {
      throw issueflow::util::ValidationError("label action must be add or remove");
    }
    auto envelope = OkEnvelope(cmd, "labeled");
    envelope.set_issue_id(id);
    return envelope;
  }

  if (cmd == "defer") {
    const auto until    = args.Flag("until-ms") ? ParseUnsigned(*args.Flag("until-ms"), "until-ms") : uint64_t{0};
    const auto record   = issues.Defer(args.Positional(0, "id"), until);
    auto       envelope = OkEnvelope(cmd, "deferred");
    envelope.set_issue_id(record.id);
    return envelope;
  }

  if (cmd == "undefer") {
    const auto record   = issues.Undefer(args.Positional(0, "id"));
    auto       envelope = OkEnvelope(cmd, "undeferred");
    envelope.set_issue_id(record.id);
    return envelope;
  }

  if (cmd == "reopen") {
    const auto record   = issues.Reopen(args.Positional(0, "id"), args.Flag("reason").value_or(""));
    auto       envelope = OkEnvelope(cmd, "reopened");
    envelope.set_issue_id(record.id);
    return envelope;
  }

  // ------------------------------------------------------------
  // Graph
  // ------------------------------------------------------------

  if (cmd == "link" || cmd == "unlink") {
    const auto& from = args.Positional(0, "from");
    const auto& to   = args.Positional(1, "to");
    const auto  type = ParseType(args.Flag("type"));
    if (cmd == "link") {
      issues.Link(from, to, type, args.Flag("note").value_or(""));
    } else {
      issues.Unlink(from, to, type);
    }
    auto envelope = OkEnvelope(cmd, cmd == "link" ? "linked" : "unlinked");
    envelope.set_issue_id(from);
    envelope.add_issue_ids(to);
    return envelope;
  }

  if (cmd == "reparent") {
    const auto& child  = args.Positional(0, "child");
    auto        parent = args.Positional(1, "parent");
    if (parent == "-") parent.clear();
    issues.Reparent(child, parent);
    auto envelope = OkEnvelope(cmd, "reparented");
    envelope.set_issue_id(child);
    return envelope;
  }

  if (cmd == "ready") {
    issueflow::graph::ReadyQuery query;
    query.parent_id = args.Flag("parent");
    if (auto priority = args.Flag("priority")) query.priority = ParseInt(*priority, "priority");
    query.labels = args.Flags("label");
    if (auto limit = args.Flag("limit")) query.limit = static_cast<size_t>(ParseUnsigned(*limit, "limit", UINT32_MAX));

    auto envelope = OkEnvelope(cmd, "listed");
    for (const auto& issue : issues.Ready(query)) {
      envelope.add_issue_ids(issue.id);
      *envelope.add_issues() = ToSummary(issue, "ready");
    }
    return envelope;
  }

  if (cmd == "blocked") {
    auto envelope = OkEnvelope(cmd, "listed");
    for (const auto& entry : issues.Blocked()) {
      envelope.add_issue_ids(entry.issue.id);
      *envelope.add_issues() = ToSummary(entry.issue, "blocked");
    }
    return envelope;
  }

  if (cmd == "deferred") {
    auto envelope = OkEnvelope(cmd, "listed");
    for (const auto& issue : issues.DeferredView()) {
      envelope.add_issue_ids(issue.id);
      *envelope.add_issues() = ToSummary(issue, "deferred");
    }
    return envelope;
  }

  if (cmd == "epics") {
    auto envelope = OkEnvelope(cmd, "listed");
    for (const auto& epic : issues.EpicsEligibleForClosure()) {
      envelope.add_issue_ids(epic.issue.id);
      *envelope.add_issues() = ToSummary(epic.issue, "eligible_for_closure");
    }
    return envelope;
  }

  if (cmd == "tree") {
    issueflow::graph::TreeOptions options;
    if (auto direction = args.Flag("direction")) {
      if (*direction == "up") {
        options.direction = issueflow::graph::TreeDirection::kUp;
      } else if (*direction != "down") {
        throw issueflow::util::ValidationError("direction must be down or up");
      }
    }
    if (auto depth = args.Flag("max-depth")) options.max_depth = static_cast<uint32_t>(ParseUnsigned(*depth, "max-depth", UINT32_MAX));
    if (args.Has("type")) {
      options.edge_types.clear();
      for (const auto& type : args.Flags("type")) {
        options.edge_types.push_back(ParseType(type));
      }
    }

    const auto& root     = args.Positional(0, "id");
    auto        envelope = OkEnvelope(cmd, "tree");
    envelope.set_issue_id(root);
    for (const auto& node : issues.Tree(root, options)) {
      auto* entry = envelope.add_tree();
      entry->set_id(node.issue.id);
      entry->set_title(node.issue.title);
      entry->set_status(std::string(issueflow::model::ToString(node.issue.status)));
      entry->set_depth(node.depth);
      entry->set_parent_id(node.parent_id);
      if (node.edge_type) entry->set_edge_type(std::string(issueflow::model::ToString(*node.edge_type)));
      entry->set_already_shown(node.already_shown);
      entry->set_truncated(node.truncated);
    }
    return envelope;
  }

  throw issueflow::util::ValidationError("unknown command '" + cmd + "'");
}

} // namespace

int main(int argc, char** argv) {
  int         next = 1;
  std::string config_path;
  if (argc >= 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
    next        = 3;
  } else if (const char* env = std::getenv("ISSUEFLOW_CONFIG")) {
    config_path = env;
  }

  if (next >= argc) {
    Usage();
    return static_cast<int>(ExitCode::kInvalidInput);
  }
  const std::string cmd = argv[next];
  if (cmd == "help" || cmd == "--help") {
    Usage();
    return 0;
  }

  issueflow::runtime::config::RuntimeConfig config;
  try {
    if (config_path.empty()) {
      config = issueflow::config::ConfigLoader::Defaults();
      config.mutable_database()->mutable_sqlite()->set_path("issueflow.db");
    } else {
      config = issueflow::config::ConfigLoader::LoadFromYaml(config_path);
    }
  } catch (const std::exception& e) {
    std::cout << issueflow::flow::ToJson(issueflow::flow::ErrorEnvelope(cmd, ExitCode::kInvalidInput, e.what())) << std::endl;
    return static_cast<int>(ExitCode::kInvalidInput);
  }

  issueflow::observability::InitializeLogging(config);

  FlowEnvelope envelope;
  try {
    const Args args(argc, argv, next + 1);
    auto       deps = issueflow::factory::Build(config);
    envelope        = Dispatch(cmd, args, deps);
  } catch (const std::exception& e) {
    envelope = ExceptionEnvelope(cmd, e);
    if (envelope.exit_code() == static_cast<int>(ExitCode::kSystemError)) {
      ISSUEFLOW_LOG_ERROR("command failed", {issueflow::observability::CommandField(cmd), issueflow::observability::ErrorField(e.what())});
    } else {
      ISSUEFLOW_LOG_WARN("command rejected", {issueflow::observability::CommandField(cmd), issueflow::observability::ErrorField(e.what())});
    }
  }

  std::cout << issueflow::flow::ToJson(envelope) << std::endl;
  issueflow::observability::ShutdownLogging();
  return envelope.exit_code();
}
