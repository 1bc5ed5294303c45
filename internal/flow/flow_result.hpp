#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "api/issueflow/v1.hpp"

namespace issueflow::flow {

/*
  Result taxonomy.

  Every flow operation returns exactly one of the types below, wrapped in a
  per-operation std::variant. Each type carries its wire tag and its process
  exit code; neither is ever reassigned.

    0  claimed wip_blocked no_ready contention closed blocked created superseded
    1  system_error
    2  invalid_input
    3  policy_violation
    4  partial_state
    5  transient_failure
    6  conflict
*/

enum class ExitCode : int {
  kOk               = 0,
  kSystemError      = 1,
  kInvalidInput     = 2,
  kPolicyViolation  = 3,
  kPartialState     = 4,
  kTransientFailure = 5,
  kConflict         = 6,
};

// ---------------------------------------------------------------------
// Success family
// ---------------------------------------------------------------------

struct Claimed {
  static constexpr std::string_view kTag  = "claimed";
  static constexpr ExitCode         kExit = ExitCode::kOk;

  std::string              actor;
  std::vector<std::string> issue_ids;

  // candidates lost to other actors on the way
  std::vector<std::string> contention_ids;
};

struct WipBlocked {
  static constexpr std::string_view kTag  = "wip_blocked";
  static constexpr ExitCode         kExit = ExitCode::kOk;

  std::string              actor;
  std::vector<std::string> in_progress_ids;
  std::uint32_t            limit = 0;
};

struct NoReady {
  static constexpr std::string_view kTag  = "no_ready";
  static constexpr ExitCode         kExit = ExitCode::kOk;

  std::string actor;
};

// Every candidate tried was taken by another actor first.
struct Contention {
  static constexpr std::string_view kTag  = "contention";
  static constexpr ExitCode         kExit = ExitCode::kOk;

  std::string              actor;
  std::vector<std::string> contention_ids;
};

struct Closed {
  static constexpr std::string_view kTag  = "closed";
  static constexpr ExitCode         kExit = ExitCode::kOk;

  std::string              issue_id;
  std::vector<std::string> unblocked_ids;
  bool                     forced = false;
};

struct Blocked {
  static constexpr std::string_view kTag  = "blocked";
  static constexpr ExitCode         kExit = ExitCode::kOk;

  std::string issue_id;
  std::string blocker_id;
  std::string context_pack;

  // false when the same blocks edge was already present
  bool edge_created = false;
};

struct Created {
  static constexpr std::string_view kTag  = "created";
  static constexpr ExitCode         kExit = ExitCode::kOk;

  std::string issue_id;
  std::string discovered_from;
};

struct Superseded {
  static constexpr std::string_view kTag  = "superseded";
  static constexpr ExitCode         kExit = ExitCode::kOk;

  std::string              issue_id;
  std::vector<std::string> replacement_ids;
};

// ---------------------------------------------------------------------
// Failure family
// ---------------------------------------------------------------------

struct PolicyViolation {
  static constexpr std::string_view kTag  = "policy_violation";
  static constexpr ExitCode         kExit = ExitCode::kPolicyViolation;

  std::string              issue_id;
  std::vector<std::string> violations;
  std::vector<std::string> blocker_ids;
  std::vector<std::string> open_child_ids;
  std::vector<std::string> secret_markers;
};

// The requested change could not be applied without leaving the graph
// inconsistent; nothing was written.
struct PartialState {
  static constexpr std::string_view kTag  = "partial_state";
  static constexpr ExitCode         kExit = ExitCode::kPartialState;

  std::string              issue_id;
  std::string              blocker_id;
  std::vector<std::string> cycle_path;
  std::string              message;
};

struct InvalidInput {
  static constexpr std::string_view kTag  = "invalid_input";
  static constexpr ExitCode         kExit = ExitCode::kInvalidInput;

  std::string message;
};

struct TransientFailure {
  static constexpr std::string_view kTag  = "transient_failure";
  static constexpr ExitCode         kExit = ExitCode::kTransientFailure;

  std::string issue_id;
  std::string message;
};

// A compare-and-set lost against a concurrent writer; re-read and retry.
struct Conflict {
  static constexpr std::string_view kTag  = "conflict";
  static constexpr ExitCode         kExit = ExitCode::kConflict;

  std::string issue_id;
  std::string message;
};

struct SystemError {
  static constexpr std::string_view kTag  = "system_error";
  static constexpr ExitCode         kExit = ExitCode::kSystemError;

  std::string issue_id;
  std::string message;
};

using ClaimResult            = std::variant<Claimed, WipBlocked, NoReady, Contention, InvalidInput, TransientFailure, SystemError>;
using CloseResult            = std::variant<Closed, PolicyViolation, InvalidInput, Conflict, TransientFailure, SystemError>;
using BlockResult            = std::variant<Blocked, PartialState, PolicyViolation, InvalidInput, Conflict, TransientFailure, SystemError>;
using CreateDiscoveredResult = std::variant<Created, InvalidInput, Conflict, TransientFailure, SystemError>;
using SupersedeResult        = std::variant<Superseded, PolicyViolation, InvalidInput, Conflict, TransientFailure, SystemError>;

template <typename Variant>
std::string_view Tag(const Variant& result) {
  return std::visit([](const auto& r) { return std::decay_t<decltype(r)>::kTag; }, result);
}

template <typename Variant>
int ExitCodeOf(const Variant& result) {
  return std::visit([](const auto& r) { return static_cast<int>(std::decay_t<decltype(r)>::kExit); }, result);
}

// Per-type envelope fillers; ok/result/exit_code are set by ToEnvelope.
void Fill(const Claimed&, issueflow::v1::FlowEnvelope*);
void Fill(const WipBlocked&, issueflow::v1::FlowEnvelope*);
void Fill(const NoReady&, issueflow::v1::FlowEnvelope*);
void Fill(const Contention&, issueflow::v1::FlowEnvelope*);
void Fill(const Closed&, issueflow::v1::FlowEnvelope*);
void Fill(const Blocked&, issueflow::v1::FlowEnvelope*);
void Fill(const Created&, issueflow::v1::FlowEnvelope*);
void Fill(const Superseded&, issueflow::v1::FlowEnvelope*);
void Fill(const PolicyViolation&, issueflow::v1::FlowEnvelope*);
void Fill(const PartialState&, issueflow::v1::FlowEnvelope*);
void Fill(const InvalidInput&, issueflow::v1::FlowEnvelope*);
void Fill(const TransientFailure&, issueflow::v1::FlowEnvelope*);
void Fill(const Conflict&, issueflow::v1::FlowEnvelope*);
void Fill(const SystemError&, issueflow::v1::FlowEnvelope*);

template <typename Variant>
issueflow::v1::FlowEnvelope ToEnvelope(std::string_view command, const Variant& result) {
  issueflow::v1::FlowEnvelope envelope;
  envelope.set_command(std::string(command));
  std::visit(
      [&envelope](const auto& r) {
        using T = std::decay_t<decltype(r)>;
        envelope.set_result(std::string(T::kTag));
        envelope.set_exit_code(static_cast<int>(T::kExit));
        envelope.set_ok(T::kExit == ExitCode::kOk);
        Fill(r, &envelope);
      },
      result);
  return envelope;
}

// Single-line JSON with proto field names; throws std::runtime_error if
// serialisation fails.
std::string ToJson(const issueflow::v1::FlowEnvelope& envelope);

// Envelope for failures that happen before an operation runs (bad
// arguments, unreadable config).
issueflow::v1::FlowEnvelope ErrorEnvelope(std::string_view command, ExitCode code, std::string_view message);

} // namespace issueflow::flow
