#pragma once

#include <memory>
#include <string>
#include <vector>

namespace issueflow::db { class Repository; }
namespace issueflow::graph { class DependencyGraph; }
namespace issueflow::status { class StatusResolver; }

namespace issueflow::core {

struct IssuePolicy {
  // root ids are <prefix>-<6 hex>
  std::string prefix = "if";

  std::vector<std::string> custom_types;
};

/*
  Dependency container shared by the issue service and the flow controller.
*/
struct ServiceContext {
  std::shared_ptr<issueflow::db::Repository> repository;
  std::shared_ptr<const issueflow::graph::DependencyGraph> graph;
  std::shared_ptr<const issueflow::status::StatusResolver> resolver;
  IssuePolicy policy;
};

}
