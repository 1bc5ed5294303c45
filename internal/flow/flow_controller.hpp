#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/issue_service.hpp"
#include "internal/core/service_context.hpp"
#include "internal/flow/flow_result.hpp"

namespace issueflow::flow {

struct FlowPolicy {
  std::uint32_t max_claims_per_actor = 1;

  // CAS losses tolerated inside one claim-next before reporting contention
  std::uint32_t max_claim_attempts = 8;

  bool require_close_reason    = true;
  bool require_verification    = true;
  bool require_children_closed = false;

  // reject close reasons and verification entries carrying credentials
  bool reject_secret_markers = true;
};

struct ClaimRequest {
  std::string   actor;
  std::uint32_t limit = 1;

  std::optional<std::string> parent_id;
  std::optional<int>         priority;
  std::vector<std::string>   labels;
};

struct CloseRequest {
  std::string              issue_id;
  std::string              reason;
  std::vector<std::string> verified;
  bool                     force = false;
};

struct BlockRequest {
  std::string issue_id;

  // optional; without it only the context pack and status change are recorded
  std::string blocker_id;

  std::string context_pack;
};

struct CreateDiscoveredRequest {
  std::string              from_id;
  core::CreateIssueRequest issue;
};

struct SupersedeRequest {
  std::string              issue_id;
  std::vector<std::string> replacement_ids;
  std::string              reason;
};

/*
  FlowController

  The atomic coordination operations. Each call:

  - runs in exactly one store transaction,
  - moves issues only through CompareAndSetStatus on (status, assignee),
  - returns one tag of the result taxonomy and never throws.

  Losing a CAS inside claim-next moves on to the next candidate; anywhere
  else it is reported as conflict.
*/
class FlowController {
 public:
  FlowController(core::ServiceContext ctx, FlowPolicy policy, std::shared_ptr<core::IssueService> issues);

  ClaimResult ClaimNext(const ClaimRequest& req);

  CloseResult CloseSafe(const CloseRequest& req);

  // Leaves the issue open with its assignee kept: ready lists it, claim-next
  // (unassigned only) does not, until someone clears the assignee.
  BlockResult BlockWithContext(const BlockRequest& req);

  CreateDiscoveredResult CreateDiscovered(const CreateDiscoveredRequest& req);

  SupersedeResult Supersede(const SupersedeRequest& req);

  const FlowPolicy& Policy() const {
    return policy_;
  }

 private:
  core::ServiceContext                ctx_;
  FlowPolicy                          policy_;
  std::shared_ptr<core::IssueService> issues_;
};

} // namespace issueflow::flow
