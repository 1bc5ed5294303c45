#include "internal/flow/flow_result.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace issueflow::flow {

using issueflow::v1::FlowEnvelope;

namespace {

void AddAll(const std::vector<std::string>& values, google::protobuf::RepeatedPtrField<std::string>* out) {
  for (const auto& value : values) {
    out->Add()->assign(value);
  }
}

std::string_view TagFor(ExitCode code) {
  switch (code) {
    case ExitCode::kOk:
      return "ok";
    case ExitCode::kSystemError:
      return SystemError::kTag;
    case ExitCode::kInvalidInput:
      return InvalidInput::kTag;
    case ExitCode::kPolicyViolation:
      return PolicyViolation::kTag;
    case ExitCode::kPartialState:
      return PartialState::kTag;
    case ExitCode::kTransientFailure:
      return TransientFailure::kTag;
    case ExitCode::kConflict:
      return Conflict::kTag;
  }
  return SystemError::kTag;
}

} // namespace

void Fill(const Claimed& r, FlowEnvelope* envelope) {
  envelope->set_actor(r.actor);
  if (!r.issue_ids.empty()) {
    envelope->set_issue_id(r.issue_ids.front());
  }
  AddAll(r.issue_ids, envelope->mutable_issue_ids());
  AddAll(r.contention_ids, envelope->mutable_contention_ids());
  envelope->add_events("claimed");
}

void Fill(const WipBlocked& r, FlowEnvelope* envelope) {
  envelope->set_actor(r.actor);
  envelope->set_message("actor " + r.actor + " already holds " + std::to_string(r.in_progress_ids.size()) + " claim(s); limit is " +
                        std::to_string(r.limit));
  AddAll(r.in_progress_ids, envelope->mutable_in_progress_ids());
  envelope->add_events("wip_gate");
}

void Fill(const NoReady& r, FlowEnvelope* envelope) {
  envelope->set_actor(r.actor);
  envelope->set_message("no ready issues");
}

void Fill(const Contention& r, FlowEnvelope* envelope) {
  envelope->set_actor(r.actor);
  envelope->set_message("every candidate was claimed by another actor; retry");
  AddAll(r.contention_ids, envelope->mutable_contention_ids());
  envelope->add_events("claim_lost");
}

void Fill(const Closed& r, FlowEnvelope* envelope) {
  envelope->set_issue_id(r.issue_id);
  AddAll(r.unblocked_ids, envelope->mutable_unblocked_ids());
  envelope->add_events(r.forced ? "closed_forced" : "closed");
  if (!r.unblocked_ids.empty()) {
    envelope->add_events("unblocked");
  }
}

void Fill(const Blocked& r, FlowEnvelope* envelope) {
  envelope->set_issue_id(r.issue_id);
  envelope->set_blocker_id(r.blocker_id);
  envelope->set_context_pack(r.context_pack);
  envelope->add_events("blocked");
  envelope->add_events("context_recorded");
  if (r.edge_created) {
    envelope->add_events("dependency_added");
  }
}

void Fill(const Created& r, FlowEnvelope* envelope) {
  envelope->set_issue_id(r.issue_id);
  if (!r.discovered_from.empty()) {
    envelope->add_issue_ids(r.discovered_from);
  }
  envelope->add_events("created");
}

void Fill(const Superseded& r, FlowEnvelope* envelope) {
  envelope->set_issue_id(r.issue_id);
  AddAll(r.replacement_ids, envelope->mutable_replacement_ids());
  envelope->add_events("superseded");
}

void Fill(const PolicyViolation& r, FlowEnvelope* envelope) {
  envelope->set_issue_id(r.issue_id);
  if (!r.violations.empty()) {
    envelope->set_message(r.violations.front());
  }
  AddAll(r.violations, envelope->mutable_violations());
  AddAll(r.blocker_ids, envelope->mutable_blocker_ids());
  AddAll(r.open_child_ids, envelope->mutable_open_child_ids());
  AddAll(r.secret_markers, envelope->mutable_secret_markers());
}

void Fill(const PartialState& r, FlowEnvelope* envelope) {
  envelope->set_issue_id(r.issue_id);
  envelope->set_blocker_id(r.blocker_id);
  envelope->set_message(r.message);
  AddAll(r.cycle_path, envelope->mutable_cycle_path());
  envelope->add_events("rolled_back");
}

void Fill(const InvalidInput& r, FlowEnvelope* envelope) {
  envelope->set_message(r.message);
}

void Fill(const TransientFailure& r, FlowEnvelope* envelope) {
  envelope->set_issue_id(r.issue_id);
  envelope->set_message(r.message);
}

void Fill(const Conflict& r, FlowEnvelope* envelope) {
  envelope->set_issue_id(r.issue_id);
  envelope->set_message(r.message);
}

void Fill(const SystemError& r, FlowEnvelope* envelope) {
  envelope->set_issue_id(r.issue_id);
  envelope->set_message(r.message);
}

std::string ToJson(const FlowEnvelope& envelope) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names   = true;
  options.always_print_primitive_fields = true;

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(envelope, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize result envelope: " + std::string(status.message()));
  }
  return json;
}

FlowEnvelope ErrorEnvelope(std::string_view command, ExitCode code, std::string_view message) {
  FlowEnvelope envelope;
  envelope.set_ok(code == ExitCode::kOk);
  envelope.set_command(std::string(command));
  envelope.set_result(std::string(TagFor(code)));
  envelope.set_exit_code(static_cast<int>(code));
  envelope.set_message(std::string(message));
  return envelope;
}

} // namespace issueflow::flow
