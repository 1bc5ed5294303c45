#include <atomic>
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "config/config.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/flow/flow_controller.hpp"
#include "internal/util/time.hpp"

namespace {

using issueflow::db::ErrorCode;
using issueflow::db::Repository;
using issueflow::db::StatusTransition;
using issueflow::db::memory::MemoryRepository;
using issueflow::db::model::DependencyKey;
using issueflow::db::model::DependencyRecord;
using issueflow::db::model::IssueRecord;
using issueflow::model::DependencyType;
using issueflow::model::IssueStatus;
using issueflow::util::NowMs;

struct BackendFactory {
  std::string                                                                      name;
  std::function<std::shared_ptr<Repository>()>                                     make_repository;
  std::function<std::shared_ptr<Repository>(const std::shared_ptr<Repository>&)> open_peer;
  std::function<bool()>                                                            supports_restart;
  std::function<void(std::shared_ptr<Repository>&)>                                restart;
  std::function<void()>                                                            cleanup;
  bool                                                                             supports_parallel_transactions = true;
};

IssueRecord MakeIssue(const std::string& id, int priority = 2) {
  IssueRecord issue;
  issue.id            = id;
  issue.title         = "issue " + id;
  issue.priority      = priority;
  issue.created_at_ms = NowMs();
  issue.updated_at_ms = issue.created_at_ms;
  return issue;
}

void InsertIssues(Repository& repo, const std::vector<std::string>& ids) {
  auto tx = repo.Begin();
  for (const auto& id : ids) {
    auto issue = MakeIssue(id);
    assert(repo.InsertIssue(*tx, issue));
  }
  tx->Commit();
}

void VerifyIssueLifecycle(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();

  auto issue = MakeIssue(id, 1);
  assert(repo.InsertIssue(*tx, issue));
  assert(issue.seq > 0);
  assert(issue.version == 1);

  auto duplicate = MakeIssue(id);
  assert(repo.InsertIssue(*tx, duplicate).code == ErrorCode::AlreadyExists);

  auto read = repo.GetIssue(*tx, id);
  assert(read.has_value());
  assert(read->title == "issue " + id);
  assert(read->priority == 1);
  assert(read->status == IssueStatus::kOpen);
  assert(read->seq == issue.seq);

  read->description = "described";
  assert(repo.UpdateIssue(*tx, *read));

  auto updated = repo.GetIssue(*tx, id);
  assert(updated->version == 2);
  assert(updated->description == "described");

  // stale version
  assert(repo.UpdateIssue(*tx, *read).code == ErrorCode::Conflict);

  assert(repo.DeleteIssue(*tx, id));
  assert(!repo.GetIssue(*tx, id).has_value());
  assert(repo.DeleteIssue(*tx, id).code == ErrorCode::NotFound);

  tx->Commit();
}

void VerifyEdgeTripleUniqueness(Repository& repo, const std::string& prefix) {
  const auto a = prefix + "-a";
  const auto b = prefix + "-b";
  InsertIssues(repo, {a, b});

  auto tx = repo.Begin();
  assert(repo.InsertDependency(*tx, DependencyRecord{.from_id = a, .to_id = b, .type = DependencyType::kBlocks, .created_at_ms = NowMs()}));
  assert(repo.InsertDependency(*tx, DependencyRecord{.from_id = a, .to_id = b, .type = DependencyType::kRelated, .created_at_ms = NowMs()}));
  assert(repo.InsertDependency(*tx, DependencyRecord{.from_id = a, .to_id = b, .type = DependencyType::kBlocks, .created_at_ms = NowMs()}).code ==
         ErrorCode::AlreadyExists);
  tx->Commit();

  tx        = repo.Begin();
  auto deps = repo.GetDependencies(*tx, a);
  assert(deps.size() == 2);
  auto dependents = repo.GetDependents(*tx, b);
  assert(dependents.size() == 2);

  assert(repo.DeleteDependency(*tx, DependencyKey{.from_id = a, .to_id = b, .type = DependencyType::kRelated}));
  assert(repo.DeleteDependency(*tx, DependencyKey{.from_id = a, .to_id = b, .type = DependencyType::kRelated}).code == ErrorCode::NotFound);

  deps = repo.GetDependencies(*tx, a);
  assert(deps.size() == 1);
  assert(deps[0].type == DependencyType::kBlocks);
  tx->Commit();
}

void VerifyCompareAndSetStatus(Repository& repo, const std::string& id) {
  InsertIssues(repo, {id});

  auto tx = repo.Begin();

  StatusTransition claim;
  claim.id                = id;
  claim.expected_status   = IssueStatus::kOpen;
  claim.expected_assignee = "";
  claim.new_status        = IssueStatus::kInProgress;
  claim.new_assignee      = "alice";
  claim.at_ms             = NowMs();
  assert(repo.CompareAndSetStatus(*tx, claim));

  // same expectation again: the row moved
  assert(repo.CompareAndSetStatus(*tx, claim).code == ErrorCode::Conflict);

  StatusTransition close;
  close.id                = id;
  close.expected_status   = IssueStatus::kInProgress;
  close.expected_assignee = "alice";
  close.new_status        = IssueStatus::kClosed;
  close.new_assignee      = "alice";
  close.close_reason      = "done";
  close.verification      = "unit tests";
  close.notes             = "Verified: unit tests";
  close.at_ms             = NowMs();
  assert(repo.CompareAndSetStatus(*tx, close));

  auto closed = repo.GetIssue(*tx, id);
  assert(closed->status == IssueStatus::kClosed);
  assert(closed->close_reason == "done");
  assert(closed->verification == "unit tests");
  assert(closed->notes == "Verified: unit tests");
  assert(closed->closed_at_ms > 0);

  StatusTransition reopen;
  reopen.id                = id;
  reopen.expected_status   = IssueStatus::kClosed;
  reopen.expected_assignee = "alice";
  reopen.new_status        = IssueStatus::kOpen;
  reopen.new_assignee      = "";
  reopen.at_ms             = NowMs();
  assert(repo.CompareAndSetStatus(*tx, reopen));

  auto reopened = repo.GetIssue(*tx, id);
  assert(reopened->status == IssueStatus::kOpen);
  assert(reopened->close_reason.empty());
  assert(reopened->closed_at_ms == 0);
  assert(reopened->notes == "Verified: unit tests");

  StatusTransition missing = claim;
  missing.id               = id + "-missing";
  assert(repo.CompareAndSetStatus(*tx, missing).code == ErrorCode::NotFound);
  tx->Commit();
}

void VerifyLabelsAndCascade(Repository& repo, const std::string& prefix) {
  const auto a = prefix + "-a";
  const auto b = prefix + "-b";
  InsertIssues(repo, {a, b});

  auto tx = repo.Begin();
  assert(repo.AddLabel(*tx, a, "backend"));
  assert(repo.AddLabel(*tx, a, "backend"));
  assert(repo.AddLabel(*tx, a, "api"));
  auto labels = repo.GetLabels(*tx, a);
  assert((labels == std::vector<std::string>{"api", "backend"}));

  assert(repo.RemoveLabel(*tx, a, "api"));
  assert(repo.GetLabels(*tx, a).size() == 1);

  assert(repo.InsertDependency(*tx, DependencyRecord{.from_id = b, .to_id = a, .type = DependencyType::kBlocks, .created_at_ms = NowMs()}));
  assert(repo.DeleteIssue(*tx, a));
  assert(repo.GetDependencies(*tx, b).empty());
  assert(repo.GetLabels(*tx, a).empty());
  tx->Commit();
}

void VerifyChildNumbers(Repository& repo, const std::string& parent) {
  InsertIssues(repo, {parent});

  auto tx = repo.Begin();
  assert(repo.AllocateChildNumber(*tx, parent) == 1);
  assert(repo.AllocateChildNumber(*tx, parent) == 2);
  tx->Commit();

  tx = repo.Begin();
  assert(repo.AllocateChildNumber(*tx, parent) == 3);
  tx->Rollback();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx    = repo.Begin();
    auto issue = MakeIssue(id);
    assert(repo.InsertIssue(*tx, issue));
    tx->Rollback();
  }

  {
    auto tx    = repo.Begin();
    auto issue = MakeIssue(id);
    assert(repo.InsertIssue(*tx, issue));
    // destructor rolls back
  }

  auto tx = repo.Begin();
  assert(!repo.GetIssue(*tx, id).has_value());
  tx->Commit();
}

void VerifyListOrdering(Repository& repo, const std::string& prefix) {
  InsertIssues(repo, {prefix + "-1", prefix + "-2", prefix + "-3"});

  auto                     tx = repo.Begin();
  std::vector<std::string> ids;
  for (const auto& issue : repo.ListIssues(*tx, issueflow::db::IssueFilter{})) {
    if (issue.id.rfind(prefix + "-", 0) == 0) ids.push_back(issue.id);
  }
  assert((ids == std::vector<std::string>{prefix + "-1", prefix + "-2", prefix + "-3"}));
  tx->Commit();
}

void VerifyConcurrentClaims(BackendFactory& backend, std::shared_ptr<Repository> repo, const std::string& prefix) {
  constexpr int kActors = 6;

  std::vector<std::string> ids;
  for (int i = 0; i < kActors; ++i) {
    ids.push_back(prefix + "-" + std::to_string(i));
  }
  // label filter keeps open issues left by the other checks out of the pool
  InsertIssues(*repo, ids);
  {
    auto tx = repo->Begin();
    for (const auto& id : ids) {
      assert(repo->AddLabel(*tx, id, prefix));
    }
    tx->Commit();
  }

  auto config = issueflow::config::ConfigLoader::Defaults();
  config.mutable_flow()->set_max_claim_attempts(64);

  std::vector<std::string> claimed(kActors);
  std::atomic<int>         failures{0};
  std::vector<std::thread> actors;
  for (int i = 0; i < kActors; ++i) {
    actors.emplace_back([&, i]() {
      auto deps = issueflow::factory::BuildWithRepository(config, backend.open_peer(repo));

      issueflow::flow::ClaimRequest req;
      req.actor  = prefix + "-actor-" + std::to_string(i);
      req.labels = {prefix};

      const auto result = deps.flow_controller->ClaimNext(req);
      if (const auto* won = std::get_if<issueflow::flow::Claimed>(&result)) {
        claimed[i] = won->issue_ids.front();
      } else {
        failures++;
      }
    });
  }
  for (auto& actor : actors) {
    actor.join();
  }

  assert(failures.load() == 0);
  const std::set<std::string> unique(claimed.begin(), claimed.end());
  assert(unique.size() == static_cast<size_t>(kActors));
  assert((unique == std::set<std::string>(ids.begin(), ids.end())));

  auto tx = repo->Begin();
  for (const auto& id : ids) {
    auto issue = repo->GetIssue(*tx, id);
    assert(issue->status == IssueStatus::kInProgress);
    assert(!issue->assignee.empty());
  }
  tx->Commit();
}

void VerifyConcurrentTransactions(Repository& repo, const std::string& id, bool supports_parallel_transactions) {
  InsertIssues(repo, {id});
  if (!supports_parallel_transactions) {
    return;
  }

  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();

  auto r1 = repo.GetIssue(*tx1, id);
  auto r2 = repo.GetIssue(*tx2, id);
  assert(r1.has_value() && r2.has_value());

  r1->title = "first";
  assert(repo.UpdateIssue(*tx1, *r1));
  tx1->Commit();

  // second writer read version 1 too; it must not overwrite the first
  r2->title       = "second";
  bool lost       = false;
  auto r2_outcome = repo.UpdateIssue(*tx2, *r2);
  if (!r2_outcome) {
    assert(r2_outcome.code == ErrorCode::Conflict);
    lost = true;
    tx2->Rollback();
  } else {
    try {
      tx2->Commit();
    } catch (const std::exception&) {
      lost = true;
    }
  }
  assert(lost);

  auto verify_tx = repo.Begin();
  auto final     = repo.GetIssue(*verify_tx, id);
  assert(final->title == "first");
  assert(final->version == 2);
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx    = repo->Begin();
    auto a     = MakeIssue(prefix + "-a");
    auto b     = MakeIssue(prefix + "-b");
    a.notes    = "Context pack: durable";
    assert(repo->InsertIssue(*tx, a));
    assert(repo->InsertIssue(*tx, b));
    assert(repo->InsertDependency(
        *tx, DependencyRecord{.from_id = a.id, .to_id = b.id, .type = DependencyType::kBlocks, .created_at_ms = NowMs(), .note = "ctx"}));
    assert(repo->AddLabel(*tx, a.id, "durable"));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto a  = repo->GetIssue(*tx, prefix + "-a");
  assert(a.has_value());
  assert(a->notes == "Context pack: durable");

  auto deps = repo->GetDependencies(*tx, prefix + "-a");
  assert(deps.size() == 1);
  assert(deps[0].to_id == prefix + "-b");
  assert(deps[0].note == "ctx");
  assert(repo->GetLabels(*tx, prefix + "-a") == std::vector<std::string>{"durable"});
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .open_peer                      = [](const std::shared_ptr<Repository>& repo) { return repo; },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if ISSUEFLOW_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("issueflow_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  // each call opens a fresh connection on the same file
  auto make_repo = [db_path]() {
    auto config = issueflow::config::ConfigLoader::Defaults();
    config.mutable_database()->mutable_sqlite()->set_path(db_path);
    return issueflow::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .open_peer                      = [make_repo](const std::shared_ptr<Repository>&) { return make_repo(); },
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
      .supports_parallel_transactions = false,
  };
}
#endif

#if ISSUEFLOW_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("ISSUEFLOW_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("ISSUEFLOW_TEST_POSTGRES_URI is not set");
  }

  auto make_repo = [conninfo = std::string(uri)]() {
    auto config = issueflow::config::ConfigLoader::Defaults();
    config.mutable_database()->mutable_postgres()->set_connection_uri(conninfo);
    return issueflow::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .open_peer                      = [](const std::shared_ptr<Repository>& repo) { return repo; },
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // unique per run so a persistent postgres database can be reused
  const auto run = backend.name + "-" + std::to_string(NowMs());

  VerifyIssueLifecycle(*repo, run + "-life");
  VerifyEdgeTripleUniqueness(*repo, run + "-edges");
  VerifyCompareAndSetStatus(*repo, run + "-cas");
  VerifyLabelsAndCascade(*repo, run + "-labels");
  VerifyChildNumbers(*repo, run + "-parent");
  VerifyRollbackBehavior(*repo, run + "-rollback");
  VerifyListOrdering(*repo, run + "-order");
  VerifyConcurrentTransactions(*repo, run + "-concurrency", backend.supports_parallel_transactions);
  VerifyConcurrentClaims(backend, repo, run + "-claims");

  VerifyRestartDurability(backend, run + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if ISSUEFLOW_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if ISSUEFLOW_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "issueflow_integration_repository_parity: pass\n";
  return 0;
}
