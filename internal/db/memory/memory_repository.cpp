#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace issueflow::db::memory {

using issueflow::model::IssueStatus;

namespace {

bool Matches(const model::IssueRecord& r, const IssueFilter& f) {
  if (f.status && r.status != *f.status) return false;
  if (f.assignee && r.assignee != *f.assignee) return false;
  if (f.issue_type && r.issue_type != *f.issue_type) return false;
  if (f.priority && r.priority != *f.priority) return false;
  return true;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::string MemoryRepository::IssueKey(const std::string& id) {
  return "issue#" + id;
}

std::string MemoryRepository::LabelsKey(const std::string& id) {
  return "labels#" + id;
}

std::string MemoryRepository::CounterKey(const std::string& parent_id) {
  return "counter#" + parent_id;
}

std::string MemoryRepository::DependencyRowKey(const model::DependencyKey& key) {
  return "dep#" + key.from_id + "#" + key.to_id + "#" + std::string(issueflow::model::ToString(key.type));
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Issues
// ------------------------------------------------------------------

Result MemoryRepository::InsertIssue(Transaction& t, model::IssueRecord& r) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  if (s.issues.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "issue " + r.id + " already exists");
  r.seq     = next_seq_.fetch_add(1);
  r.version = 1;
  s.issues[r.id] = r;
  tx.TouchIssue(r.id);
  return Result::Ok();
}

std::optional<model::IssueRecord> MemoryRepository::GetIssue(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.issues.find(id);
  if (it == s.issues.end()) return std::nullopt;
  return it->second;
}

std::vector<model::IssueRecord> MemoryRepository::ListIssues(Transaction& t, const IssueFilter& filter) {
  const auto&                     s = TX(t).View();
  std::vector<model::IssueRecord> records;
  for (const auto& [_, record] : s.issues) {
    if (Matches(record, filter)) records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) { return a.seq < b.seq; });
  if (filter.limit > 0 && records.size() > filter.limit) {
    records.resize(filter.limit);
  }
  return records;
}

Result MemoryRepository::UpdateIssue(Transaction& t, const model::IssueRecord& r) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  auto  it = s.issues.find(r.id);
  if (it == s.issues.end()) return Result::Err(ErrorCode::NotFound, "issue " + r.id + " not found");
  if (it->second.version != r.version) {
    return Result::Err(ErrorCode::Conflict, "issue " + r.id + " changed since it was read");
  }

  auto updated    = r;
  updated.seq     = it->second.seq;
  updated.version = r.version + 1;
  it->second      = std::move(updated);
  tx.TouchIssue(r.id);
  return Result::Ok();
}

Result MemoryRepository::DeleteIssue(Transaction& t, const std::string& id) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  if (!s.issues.contains(id)) return Result::Err(ErrorCode::NotFound, "issue " + id + " not found");

  s.issues.erase(id);
  tx.TouchIssue(id);
  s.labels.erase(id);
  tx.TouchLabels(id);

  for (auto it = s.dependencies.begin(); it != s.dependencies.end();) {
    if (it->first.from_id == id || it->first.to_id == id) {
      tx.TouchDependency(it->first);
      it = s.dependencies.erase(it);
    } else {
      ++it;
    }
  }
  return Result::Ok();
}

Result MemoryRepository::CompareAndSetStatus(Transaction& t, const StatusTransition& cas) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  auto  it = s.issues.find(cas.id);
  if (it == s.issues.end()) return Result::Err(ErrorCode::NotFound, "issue " + cas.id + " not found");

  auto& r = it->second;
  if (r.status != cas.expected_status || r.assignee != cas.expected_assignee) {
    return Result::Err(ErrorCode::Conflict, "issue " + cas.id + " status/assignee changed");
  }

  r.status   = cas.new_status;
  r.assignee = cas.new_assignee;
  if (cas.new_status == IssueStatus::kClosed) {
    r.close_reason = cas.close_reason;
    r.verification = cas.verification;
    r.closed_at_ms = cas.at_ms;
  } else {
    r.close_reason.clear();
    r.verification.clear();
    r.closed_at_ms = 0;
  }
  if (cas.notes) r.notes = *cas.notes;
  r.updated_at_ms = cas.at_ms;
  r.version++;
  tx.TouchIssue(cas.id);
  return Result::Ok();
}

uint64_t MemoryRepository::AllocateChildNumber(Transaction& t, const std::string& parent_id) {
  auto& tx   = TX(t);
  auto  next = ++tx.Mutable().child_counters[parent_id];
  tx.TouchCounter(parent_id);
  return next;
}

// ------------------------------------------------------------------
// Labels
// ------------------------------------------------------------------

Result MemoryRepository::AddLabel(Transaction& t, const std::string& issue_id, const std::string& label) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  if (!s.issues.contains(issue_id)) return Result::Err(ErrorCode::NotFound, "issue " + issue_id + " not found");
  s.labels[issue_id].insert(label);
  tx.TouchLabels(issue_id);
  return Result::Ok();
}

Result MemoryRepository::RemoveLabel(Transaction& t, const std::string& issue_id, const std::string& label) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  auto  it = s.labels.find(issue_id);
  if (it != s.labels.end()) {
    it->second.erase(label);
    if (it->second.empty()) s.labels.erase(it);
    tx.TouchLabels(issue_id);
  }
  return Result::Ok();
}

std::vector<std::string> MemoryRepository::GetLabels(Transaction& t, const std::string& issue_id) {
  const auto& s  = TX(t).View();
  auto        it = s.labels.find(issue_id);
  if (it == s.labels.end()) return {};
  return {it->second.begin(), it->second.end()};
}

// ------------------------------------------------------------------
// Dependencies
// ------------------------------------------------------------------

Result MemoryRepository::InsertDependency(Transaction& t, const model::DependencyRecord& r) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  if (r.from_id == r.to_id) {
    return Result::Err(ErrorCode::ConstraintViolation, "self dependency on " + r.from_id);
  }
  if (!s.issues.contains(r.from_id)) return Result::Err(ErrorCode::NotFound, "issue " + r.from_id + " not found");
  if (!s.issues.contains(r.to_id)) return Result::Err(ErrorCode::NotFound, "issue " + r.to_id + " not found");

  auto key = r.Key();
  if (s.dependencies.contains(key)) {
    return Result::Err(ErrorCode::AlreadyExists, "dependency already exists");
  }
  s.dependencies.emplace(key, r);
  tx.TouchDependency(key);
  return Result::Ok();
}

Result MemoryRepository::DeleteDependency(Transaction& t, const model::DependencyKey& key) {
  auto& tx = TX(t);
  if (tx.Mutable().dependencies.erase(key) == 0) {
    return Result::Err(ErrorCode::NotFound, "dependency not found");
  }
  tx.TouchDependency(key);
  return Result::Ok();
}

std::vector<model::DependencyRecord> MemoryRepository::GetDependencies(Transaction& t, const std::string& issue_id) {
  std::vector<model::DependencyRecord> out;
  for (const auto& [key, record] : TX(t).View().dependencies)
    if (key.from_id == issue_id) out.push_back(record);
  return out;
}

std::vector<model::DependencyRecord> MemoryRepository::GetDependents(Transaction& t, const std::string& issue_id) {
  std::vector<model::DependencyRecord> out;
  for (const auto& [key, record] : TX(t).View().dependencies)
    if (key.to_id == issue_id) out.push_back(record);
  return out;
}

Result MemoryRepository::LockDependencyGraph(Transaction& t) {
  TX(t).Touch(kGraphKey);
  return Result::Ok();
}

} // namespace issueflow::db::memory
