#include "internal/flow/flow_controller.hpp"

#include <algorithm>
#include <set>
#include <type_traits>
#include <variant>

#include "internal/core/db_errors.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/graph/dependency_graph.hpp"
#include "internal/observability/logging.hpp"
#include "internal/status/status_resolver.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"

namespace issueflow::flow {

using db::model::DependencyRecord;
using db::model::IssueRecord;
using issueflow::model::DependencyType;
using issueflow::model::IssueStatus;
using observability::ActorField;
using observability::CommandField;
using observability::IssueField;
using observability::OutcomeField;
using status::StatusResolver;

namespace {

constexpr std::string_view kClaimNext        = "claim-next";
constexpr std::string_view kCloseSafe        = "close-safe";
constexpr std::string_view kBlockWithContext = "block-with-context";
constexpr std::string_view kCreateDiscovered = "create-discovered";
constexpr std::string_view kSupersede        = "supersede";

template <typename T, typename Variant>
struct IsAlternative;

template <typename T, typename... Ts>
struct IsAlternative<T, std::variant<Ts...>> : std::bool_constant<(std::is_same_v<T, Ts> || ...)> {};

template <typename T, typename Variant>
inline constexpr bool kHas = IsAlternative<T, Variant>::value;

template <typename Variant>
void LogOutcome(std::string_view command, const std::string& issue_id, const Variant& result) {
  const auto tag  = Tag(result);
  const auto code = ExitCodeOf(result);
  if (code == static_cast<int>(ExitCode::kSystemError)) {
    ISSUEFLOW_LOG_ERROR("flow operation failed", {CommandField(command), OutcomeField(tag), IssueField(issue_id)});
  } else if (code != static_cast<int>(ExitCode::kOk)) {
    ISSUEFLOW_LOG_WARN("flow operation rejected", {CommandField(command), OutcomeField(tag), IssueField(issue_id)});
  } else {
    ISSUEFLOW_LOG_INFO("flow operation", {CommandField(command), OutcomeField(tag), IssueField(issue_id)});
  }
}

// Maps the util exception family onto the alternatives the operation's
// result type actually has.
template <typename Variant, typename Fn>
Variant Guard(std::string_view command, const std::string& issue_id, Fn&& fn) {
  auto result = [&]() -> Variant {
    try {
      return fn();
    } catch (const util::ValidationError& e) {
      return InvalidInput{.message = e.what()};
    } catch (const util::CycleDetected& e) {
      if constexpr (kHas<PartialState, Variant>) {
        return PartialState{.issue_id = issue_id, .message = e.what()};
      } else {
        return InvalidInput{.message = e.what()};
      }
    } catch (const util::NotFound& e) {
      if constexpr (kHas<PolicyViolation, Variant>) {
        return PolicyViolation{.issue_id = issue_id, .violations = {e.what()}};
      } else {
        return InvalidInput{.message = e.what()};
      }
    } catch (const util::PolicyViolation& e) {
      if constexpr (kHas<PolicyViolation, Variant>) {
        return PolicyViolation{.issue_id = issue_id, .violations = {e.what()}};
      } else {
        return InvalidInput{.message = e.what()};
      }
    } catch (const util::Conflict& e) {
      if constexpr (kHas<Conflict, Variant>) {
        return Conflict{.issue_id = issue_id, .message = e.what()};
      } else {
        return Contention{.contention_ids = {issue_id}};
      }
    } catch (const util::AlreadyExists& e) {
      if constexpr (kHas<Conflict, Variant>) {
        return Conflict{.issue_id = issue_id, .message = e.what()};
      } else {
        return SystemError{.issue_id = issue_id, .message = e.what()};
      }
    } catch (const util::StoreUnavailable& e) {
      return TransientFailure{.issue_id = issue_id, .message = e.what()};
    } catch (const std::exception& e) {
      return SystemError{.issue_id = issue_id, .message = e.what()};
    }
  }();

  LogOutcome(command, issue_id, result);
  return result;
}

std::vector<std::string> TrimmedNonEmpty(const std::vector<std::string>& values) {
  std::vector<std::string> out;
  for (const auto& value : values) {
    auto trimmed = util::Trim(value);
    if (!trimmed.empty()) {
      out.push_back(std::move(trimmed));
    }
  }
  return out;
}

} // namespace

FlowController::FlowController(core::ServiceContext ctx, FlowPolicy policy, std::shared_ptr<core::IssueService> issues)
    : ctx_(std::move(ctx)), policy_(policy), issues_(std::move(issues)) {
  if (policy_.max_claims_per_actor == 0) {
    policy_.max_claims_per_actor = 1;
  }
  if (policy_.max_claim_attempts == 0) {
    policy_.max_claim_attempts = 1;
  }
}

// ------------------------------------------------------------------
// claim-next
// ------------------------------------------------------------------

ClaimResult FlowController::ClaimNext(const ClaimRequest& req) {
  const auto actor = util::Trim(req.actor);

  return Guard<ClaimResult>(kClaimNext, actor, [&]() -> ClaimResult {
    if (actor.empty()) {
      return InvalidInput{.message = "actor is required"};
    }
    if (req.limit == 0) {
      return InvalidInput{.message = "limit must be at least 1"};
    }
    if (req.priority) {
      StatusResolver::ValidatePriority(*req.priority);
    }

    graph::ReadyQuery query;
    query.parent_id       = req.parent_id;
    query.priority        = req.priority;
    query.unassigned_only = true;
    for (const auto& label : req.labels) {
      query.labels.push_back(StatusResolver::ValidateLabel(label));
    }

    auto&         repo = *ctx_.repository;
    Claimed       claimed{.actor = actor};
    std::uint32_t lost = 0;

    while (claimed.issue_ids.size() < req.limit) {
      auto       tx  = repo.Begin();
      const auto now = util::NowMs();

      db::IssueFilter held_filter;
      held_filter.status   = IssueStatus::kInProgress;
      held_filter.assignee = actor;
      const auto held      = repo.ListIssues(*tx, held_filter);
      if (held.size() >= policy_.max_claims_per_actor) {
        if (!claimed.issue_ids.empty()) {
          break;
        }
        WipBlocked blocked{.actor = actor, .limit = policy_.max_claims_per_actor};
        for (const auto& issue : held) {
          blocked.in_progress_ids.push_back(issue.id);
        }
        return blocked;
      }

      query.limit           = 1;
      const auto candidates = ctx_.graph->ReadySet(repo, *tx, query, now);
      if (candidates.empty()) {
        break;
      }
      const auto& candidate = candidates.front();

      db::StatusTransition cas;
      cas.id                = candidate.id;
      cas.expected_status   = IssueStatus::kOpen;
      cas.expected_assignee = "";
      cas.new_status        = IssueStatus::kInProgress;
      cas.new_assignee      = actor;
      cas.at_ms             = now;

      const auto cas_result = repo.CompareAndSetStatus(*tx, cas);
      bool       won        = false;
      if (cas_result.code == db::ErrorCode::Conflict || cas_result.code == db::ErrorCode::NotFound) {
        tx->Rollback();
      } else {
        core::ThrowIfDbError(cas_result, "claim " + candidate.id);
        try {
          tx->Commit();
          won = true;
        } catch (const util::Conflict&) {
          // another actor's commit touched the same row first
        }
      }

      if (won) {
        claimed.issue_ids.push_back(candidate.id);
        continue;
      }

      claimed.contention_ids.push_back(candidate.id);
      ISSUEFLOW_LOG_DEBUG("claim lost", {ActorField(actor), IssueField(candidate.id)});
      if (++lost >= policy_.max_claim_attempts) {
        break;
      }
    }

    if (!claimed.issue_ids.empty()) {
      return claimed;
    }
    if (!claimed.contention_ids.empty()) {
      return Contention{.actor = actor, .contention_ids = std::move(claimed.contention_ids)};
    }
    return NoReady{.actor = actor};
  });
}

// ------------------------------------------------------------------
// close-safe
// ------------------------------------------------------------------

CloseResult FlowController::CloseSafe(const CloseRequest& req) {
  const auto issue_id = util::Trim(req.issue_id);

  return Guard<CloseResult>(kCloseSafe, issue_id, [&]() -> CloseResult {
    if (issue_id.empty()) {
      return InvalidInput{.message = "issue id is required"};
    }
    const auto reason   = util::Trim(req.reason);
    const auto verified = TrimmedNonEmpty(req.verified);

    auto& repo  = *ctx_.repository;
    auto  tx    = repo.Begin();
    auto  issue = repo.GetIssue(*tx, issue_id);
    if (!issue) {
      return PolicyViolation{.issue_id = issue_id, .violations = {"issue " + issue_id + " not found"}};
    }
    if (issue->status == IssueStatus::kClosed) {
      return PolicyViolation{.issue_id = issue_id, .violations = {"issue " + issue_id + " is already closed"}};
    }

    PolicyViolation violation{.issue_id = issue_id};
    if (policy_.require_close_reason && reason.empty()) {
      violation.violations.push_back("close reason is required");
    }
    if (policy_.require_verification && verified.empty()) {
      violation.violations.push_back("at least one verification entry is required");
    }

    if (policy_.reject_secret_markers) {
      violation.secret_markers = util::FindSecretMarkers(reason + "\n" + util::Join(verified, "\n"));
      if (!violation.secret_markers.empty()) {
        violation.violations.push_back("secret marker detected in close payload: " + util::Join(violation.secret_markers, ", "));
      }
    }

    const auto blockers = ctx_.graph->BlockingEdges(repo, *tx, issue_id);
    if (!blockers.empty() && !req.force) {
      for (const auto& edge : blockers) {
        violation.blocker_ids.push_back(edge.to_id);
      }
      violation.violations.push_back("issue " + issue_id + " has " + std::to_string(blockers.size()) + " unresolved blocker(s)");
    }

    if (policy_.require_children_closed) {
      for (const auto& child : ctx_.graph->Children(repo, *tx, issue_id)) {
        if (child.status != IssueStatus::kClosed) {
          violation.open_child_ids.push_back(child.id);
        }
      }
      if (!violation.open_child_ids.empty()) {
        violation.violations.push_back("issue " + issue_id + " has " + std::to_string(violation.open_child_ids.size()) + " open child issue(s)");
      }
    }

    if (!violation.violations.empty()) {
      tx->Rollback();
      return violation;
    }

    std::string notes = issue->notes;
    for (const auto& entry : verified) {
      notes = util::AppendNotesLine(notes, "Verified: " + entry);
    }

    db::StatusTransition cas;
    cas.id                = issue_id;
    cas.expected_status   = issue->status;
    cas.expected_assignee = issue->assignee;
    cas.new_status        = IssueStatus::kClosed;
    cas.new_assignee      = issue->assignee;
    cas.close_reason      = reason;
    cas.verification      = util::Join(verified, "; ");
    cas.notes             = notes;
    cas.at_ms             = util::NowMs();

    const auto cas_result = repo.CompareAndSetStatus(*tx, cas);
    if (cas_result.code == db::ErrorCode::Conflict) {
      tx->Rollback();
      return Conflict{.issue_id = issue_id, .message = "issue " + issue_id + " changed concurrently; re-read and retry"};
    }
    core::ThrowIfDbError(cas_result, "close issue");

    auto unblocked = ctx_.graph->NewlyUnblockedBy(repo, *tx, issue_id);
    tx->Commit();

    ISSUEFLOW_LOG_DEBUG("issue closed", {IssueField(issue_id), observability::BoolField("forced", !blockers.empty()),
                                         observability::IntField("unblocked", static_cast<std::int64_t>(unblocked.size()))});

    return Closed{.issue_id = issue_id, .unblocked_ids = std::move(unblocked), .forced = !blockers.empty()};
  });
}

// ------------------------------------------------------------------
// block-with-context
// ------------------------------------------------------------------

BlockResult FlowController::BlockWithContext(const BlockRequest& req) {
  const auto issue_id = util::Trim(req.issue_id);

  return Guard<BlockResult>(kBlockWithContext, issue_id, [&]() -> BlockResult {
    const auto blocker_id   = util::Trim(req.blocker_id);
    const auto context_pack = util::Trim(req.context_pack);
    if (issue_id.empty()) {
      return InvalidInput{.message = "issue id is required"};
    }
    if (context_pack.empty()) {
      return InvalidInput{.message = "context pack is required"};
    }

    auto& repo = *ctx_.repository;
    auto  tx   = repo.Begin();
    if (!blocker_id.empty()) {
      core::ThrowIfDbError(repo.LockDependencyGraph(*tx), "lock dependency graph");
    }

    auto issue = repo.GetIssue(*tx, issue_id);
    if (!issue) {
      return PolicyViolation{.issue_id = issue_id, .violations = {"issue " + issue_id + " not found"}};
    }
    if (issue->status == IssueStatus::kClosed) {
      return PolicyViolation{.issue_id = issue_id, .violations = {"issue " + issue_id + " is closed"}};
    }

    const auto now          = util::NowMs();
    bool       edge_created = false;
    if (!blocker_id.empty()) {
      if (!repo.GetIssue(*tx, blocker_id)) {
        return PolicyViolation{.issue_id = issue_id, .violations = {"blocker " + blocker_id + " not found"}};
      }

      if (auto path = ctx_.graph->FindCyclePath(repo, *tx, issue_id, blocker_id, DependencyType::kBlocks)) {
        tx->Rollback();
        return PartialState{.issue_id   = issue_id,
                            .blocker_id = blocker_id,
                            .cycle_path = std::move(*path),
                            .message    = "blocks edge " + issue_id + " -> " + blocker_id + " would create a cycle; nothing was written"};
      }

      DependencyRecord edge;
      edge.from_id       = issue_id;
      edge.to_id         = blocker_id;
      edge.type          = DependencyType::kBlocks;
      edge.created_at_ms = now;
      edge.note          = context_pack;

      const auto inserted = repo.InsertDependency(*tx, edge);
      if (inserted.code != db::ErrorCode::AlreadyExists) {
        core::ThrowIfDbError(inserted, "insert blocker edge");
        edge_created = true;
      }
    }

    db::StatusTransition cas;
    cas.id                = issue_id;
    cas.expected_status   = issue->status;
    cas.expected_assignee = issue->assignee;
    cas.new_status        = issue->status == IssueStatus::kInProgress ? IssueStatus::kOpen : issue->status;
    cas.new_assignee      = issue->assignee;
    cas.notes             = util::AppendNotesLine(issue->notes, "Context pack: " + context_pack);
    cas.at_ms             = now;

    const auto cas_result = repo.CompareAndSetStatus(*tx, cas);
    if (cas_result.code == db::ErrorCode::Conflict) {
      tx->Rollback();
      return Conflict{.issue_id = issue_id, .message = "issue " + issue_id + " changed concurrently; re-read and retry"};
    }
    core::ThrowIfDbError(cas_result, "record context pack");
    tx->Commit();

    return Blocked{.issue_id = issue_id, .blocker_id = blocker_id, .context_pack = context_pack, .edge_created = edge_created};
  });
}

// ------------------------------------------------------------------
// create-discovered
// ------------------------------------------------------------------

CreateDiscoveredResult FlowController::CreateDiscovered(const CreateDiscoveredRequest& req) {
  const auto from_id = util::Trim(req.from_id);

  return Guard<CreateDiscoveredResult>(kCreateDiscovered, from_id, [&]() -> CreateDiscoveredResult {
    if (from_id.empty()) {
      return InvalidInput{.message = "discovered-from issue id is required"};
    }

    auto tx = ctx_.repository->Begin();
    if (!ctx_.repository->GetIssue(*tx, from_id)) {
      return InvalidInput{.message = "discovered-from issue " + from_id + " not found"};
    }

    auto request            = req.issue;
    request.discovered_from = from_id;
    const auto record       = issues_->CreateInTx(*tx, request);
    tx->Commit();

    return Created{.issue_id = record.id, .discovered_from = from_id};
  });
}

// ------------------------------------------------------------------
// supersede
// ------------------------------------------------------------------

SupersedeResult FlowController::Supersede(const SupersedeRequest& req) {
  const auto issue_id = util::Trim(req.issue_id);

  return Guard<SupersedeResult>(kSupersede, issue_id, [&]() -> SupersedeResult {
    if (issue_id.empty()) {
      return InvalidInput{.message = "issue id is required"};
    }

    std::vector<std::string> replacements;
    std::set<std::string>    seen;
    for (auto& id : TrimmedNonEmpty(req.replacement_ids)) {
      if (seen.insert(id).second) {
        replacements.push_back(std::move(id));
      }
    }
    if (replacements.empty()) {
      return InvalidInput{.message = "at least one replacement issue is required"};
    }

    auto& repo = *ctx_.repository;
    auto  tx   = repo.Begin();
    core::ThrowIfDbError(repo.LockDependencyGraph(*tx), "lock dependency graph");

    auto issue = repo.GetIssue(*tx, issue_id);
    if (!issue) {
      return PolicyViolation{.issue_id = issue_id, .violations = {"issue " + issue_id + " not found"}};
    }
    if (issue->status == IssueStatus::kClosed) {
      return PolicyViolation{.issue_id = issue_id, .violations = {"issue " + issue_id + " is already closed"}};
    }

    PolicyViolation violation{.issue_id = issue_id};
    for (const auto& id : replacements) {
      if (id == issue_id) {
        violation.violations.push_back("issue " + issue_id + " cannot supersede itself");
        continue;
      }
      const auto replacement = repo.GetIssue(*tx, id);
      if (!replacement) {
        violation.violations.push_back("replacement " + id + " not found");
      } else if (replacement->status == IssueStatus::kClosed) {
        violation.violations.push_back("replacement " + id + " is closed");
      }
    }
    if (!violation.violations.empty()) {
      tx->Rollback();
      return violation;
    }

    const auto now    = util::NowMs();
    const auto joined = util::Join(replacements, ",");
    const auto reason = util::Trim(req.reason).empty() ? "superseded by " + joined : util::Trim(req.reason);

    for (const auto& id : replacements) {
      DependencyRecord edge;
      edge.from_id       = id;
      edge.to_id         = issue_id;
      edge.type          = DependencyType::kSupersedes;
      edge.created_at_ms = now;
      edge.note          = reason;

      const auto inserted = repo.InsertDependency(*tx, edge);
      if (inserted.code != db::ErrorCode::AlreadyExists) {
        core::ThrowIfDbError(inserted, "insert supersedes edge");
      }
    }

    db::StatusTransition cas;
    cas.id                = issue_id;
    cas.expected_status   = issue->status;
    cas.expected_assignee = issue->assignee;
    cas.new_status        = IssueStatus::kClosed;
    cas.new_assignee      = issue->assignee;
    cas.close_reason      = reason;
    cas.notes             = util::AppendNotesLine(issue->notes, "Superseded by: " + joined);
    cas.at_ms             = now;

    const auto cas_result = repo.CompareAndSetStatus(*tx, cas);
    if (cas_result.code == db::ErrorCode::Conflict) {
      tx->Rollback();
      return Conflict{.issue_id = issue_id, .message = "issue " + issue_id + " changed concurrently; re-read and retry"};
    }
    core::ThrowIfDbError(cas_result, "close superseded issue");
    tx->Commit();

    return Superseded{.issue_id = issue_id, .replacement_ids = std::move(replacements)};
  });
}

} // namespace issueflow::flow
