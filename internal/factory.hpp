#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/issue_service.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/flow/flow_controller.hpp"
#include "internal/graph/dependency_graph.hpp"
#include "internal/status/status_resolver.hpp"

namespace issueflow::factory {

/*
  RuntimeDependencies

  Owns all long-lived objects used by one issueflowctl invocation.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<const graph::DependencyGraph> graph;
  std::shared_ptr<const status::StatusResolver> resolver;

  std::shared_ptr<core::IssueService>   issue_service;
  std::shared_ptr<flow::FlowController> flow_controller;
};

/*
  Build

  Constructs the engine for the configured store.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
RuntimeDependencies Build(const issueflow::runtime::config::RuntimeConfig& config);

// Same wiring over an existing repository (tests, parity suites).
RuntimeDependencies BuildWithRepository(const issueflow::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository);

std::shared_ptr<db::Repository> BuildRepository(const issueflow::runtime::config::RuntimeConfig& config);

flow::FlowPolicy MakeFlowPolicy(const issueflow::runtime::config::FlowConfig& config);

} // namespace issueflow::factory
