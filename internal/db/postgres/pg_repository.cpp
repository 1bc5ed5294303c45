#include "pg_repository.hpp"

#include <optional>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace issueflow::db::postgres {

using issueflow::model::IssueStatus;

namespace {

std::string StatusText(IssueStatus status) {
  return std::string(issueflow::model::ToString(status));
}

model::IssueRecord ReadIssue(const pqxx::row& row) {
  model::IssueRecord r;
  r.id            = row[0].c_str();
  r.title         = row[1].c_str();
  r.description   = row[2].c_str();
  r.notes         = row[3].c_str();
  r.metadata_json = row[4].c_str();
  r.issue_type    = row[5].c_str();
  r.priority      = row[6].as<int>();

  auto status = issueflow::model::ParseIssueStatus(row[7].c_str());
  if (!status) {
    throw std::runtime_error("issue " + r.id + " has an unknown stored status");
  }
  r.status = *status;

  r.assignee       = row[8].c_str();
  r.defer_until_ms = row[9].as<uint64_t>();
  r.close_reason   = row[10].c_str();
  r.verification   = row[11].c_str();
  r.created_at_ms  = row[12].as<uint64_t>();
  r.updated_at_ms  = row[13].as<uint64_t>();
  r.closed_at_ms   = row[14].as<uint64_t>();
  r.seq            = row[15].as<uint64_t>();
  r.version        = row[16].as<uint64_t>();
  return r;
}

model::DependencyRecord ReadDependency(const pqxx::row& row) {
  model::DependencyRecord r;
  r.from_id = row[0].c_str();
  r.to_id   = row[1].c_str();

  auto type = issueflow::model::ParseDependencyType(row[2].c_str());
  if (!type) {
    throw std::runtime_error("dependency " + r.from_id + " -> " + r.to_id + " has an unknown stored type");
  }
  r.type          = *type;
  r.created_at_ms = row[3].as<uint64_t>();
  r.note          = row[4].c_str();
  return r;
}

// Reads have no Result channel; surface lost connections as transient.
template <typename Fn>
auto Read(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::broken_connection& e) {
    throw util::StoreUnavailable(std::string("postgres connection lost: ") + e.what());
  }
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::foreign_key_violation*>(&e)) return Result::Err(ErrorCode::NotFound, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Conflict, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::Unavailable, e.what());
  if (dynamic_cast<const pqxx::statement_completion_unknown*>(&e)) return Result::Err(ErrorCode::Timeout, e.what());
  if (const auto* sql = dynamic_cast<const pqxx::sql_error*>(&e)) {
    // lock_not_available: lock_timeout expired on a claimed row or the graph lock
    if (sql->sqlstate() == "55P03") return Result::Err(ErrorCode::Busy, e.what());
    // query_canceled: statement_timeout or an operator cancel
    if (sql->sqlstate() == "57014") return Result::Err(ErrorCode::Timeout, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

bool PgRepository::Exists(pqxx::work& work, const std::string& id) {
  return !work.exec_prepared("issue_exists", id).empty();
}

// ------------------------------------------------------------------
// Issues
// ------------------------------------------------------------------

Result PgRepository::InsertIssue(Transaction& t, model::IssueRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_issue", r.id, r.title, r.description, r.notes, r.metadata_json, r.issue_type,
                                          r.priority, StatusText(r.status), r.assignee, r.defer_until_ms, r.close_reason,
                                          r.verification, r.created_at_ms, r.updated_at_ms, r.closed_at_ms);
    r.seq     = res[0][0].as<uint64_t>();
    r.version = 1;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::IssueRecord> PgRepository::GetIssue(Transaction& t, const std::string& id) {
  return Read([&]() -> std::optional<model::IssueRecord> {
    auto res = TX(t).Work().exec_prepared("get_issue", id);
    if (res.empty()) return std::nullopt;
    return ReadIssue(res[0]);
  });
}

std::vector<model::IssueRecord> PgRepository::ListIssues(Transaction& t, const IssueFilter& filter) {
  return Read([&]() {
    auto& work = TX(t).Work();

    std::string    sql = "SELECT id,title,description,notes,metadata,issue_type,priority,status,assignee,defer_until_ms,"
                         "close_reason,verification,created_at_ms,updated_at_ms,closed_at_ms,seq,version FROM issues WHERE 1=1";
    pqxx::params   params;
    int            idx = 1;
    if (filter.status) {
      sql += " AND status=$" + std::to_string(idx++);
      params.append(StatusText(*filter.status));
    }
    if (filter.assignee) {
      sql += " AND assignee=$" + std::to_string(idx++);
      params.append(*filter.assignee);
    }
    if (filter.issue_type) {
      sql += " AND issue_type=$" + std::to_string(idx++);
      params.append(*filter.issue_type);
    }
    if (filter.priority) {
      sql += " AND priority=$" + std::to_string(idx++);
      params.append(*filter.priority);
    }
    sql += " ORDER BY seq";
    if (filter.limit > 0) sql += " LIMIT " + std::to_string(filter.limit);

    auto                            res = work.exec_params(sql, params);
    std::vector<model::IssueRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadIssue(row));
    return out;
  });
}

Result PgRepository::UpdateIssue(Transaction& t, const model::IssueRecord& r) {
  try {
    auto& work = TX(t).Work();
    auto  res  = work.exec_prepared("update_issue", r.id, r.title, r.description, r.notes, r.metadata_json, r.issue_type, r.priority,
                                    StatusText(r.status), r.assignee, r.defer_until_ms, r.close_reason, r.verification,
                                    r.updated_at_ms, r.closed_at_ms, r.version);
    if (res.affected_rows() == 0) {
      if (!Exists(work, r.id)) return Result::Err(ErrorCode::NotFound, "issue " + r.id + " not found");
      return Result::Err(ErrorCode::Conflict, "issue " + r.id + " changed since it was read");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteIssue(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_issue", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "issue " + id + " not found");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::CompareAndSetStatus(Transaction& t, const StatusTransition& cas) {
  try {
    auto&      work    = TX(t).Work();
    const bool closing = cas.new_status == IssueStatus::kClosed;
    auto       res     = work.exec_prepared("cas_status", cas.id, StatusText(cas.new_status), cas.new_assignee,
                                            closing ? cas.close_reason : std::string(), closing ? cas.verification : std::string(),
                                            closing ? cas.at_ms : uint64_t{0}, cas.notes, cas.at_ms, StatusText(cas.expected_status),
                                            cas.expected_assignee);
    if (res.affected_rows() == 0) {
      if (!Exists(work, cas.id)) return Result::Err(ErrorCode::NotFound, "issue " + cas.id + " not found");
      return Result::Err(ErrorCode::Conflict, "issue " + cas.id + " status/assignee changed");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

uint64_t PgRepository::AllocateChildNumber(Transaction& t, const std::string& parent_id) {
  return Read([&]() { return TX(t).Work().exec_prepared("next_child_number", parent_id)[0][0].as<uint64_t>(); });
}

// ------------------------------------------------------------------
// Labels
// ------------------------------------------------------------------

Result PgRepository::AddLabel(Transaction& t, const std::string& issue_id, const std::string& label) {
  try {
    TX(t).Work().exec_prepared("insert_label", issue_id, label);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::RemoveLabel(Transaction& t, const std::string& issue_id, const std::string& label) {
  try {
    TX(t).Work().exec_prepared("delete_label", issue_id, label);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<std::string> PgRepository::GetLabels(Transaction& t, const std::string& issue_id) {
  return Read([&]() {
    auto                     res = TX(t).Work().exec_prepared("select_labels", issue_id);
    std::vector<std::string> out;
    out.reserve(res.size());
    for (const auto& row : res) out.emplace_back(row[0].c_str());
    return out;
  });
}

// ------------------------------------------------------------------
// Dependencies
// ------------------------------------------------------------------

Result PgRepository::InsertDependency(Transaction& t, const model::DependencyRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_dependency", r.from_id, r.to_id, std::string(issueflow::model::ToString(r.type)),
                                          r.created_at_ms, r.note);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, "dependency already exists");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteDependency(Transaction& t, const model::DependencyKey& key) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_dependency", key.from_id, key.to_id, std::string(issueflow::model::ToString(key.type)));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "dependency not found");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::DependencyRecord> PgRepository::GetDependencies(Transaction& t, const std::string& issue_id) {
  return Read([&]() {
    auto                                 res = TX(t).Work().exec_prepared("select_dependencies", issue_id);
    std::vector<model::DependencyRecord> out;
    for (const auto& row : res) out.push_back(ReadDependency(row));
    return out;
  });
}

std::vector<model::DependencyRecord> PgRepository::GetDependents(Transaction& t, const std::string& issue_id) {
  return Read([&]() {
    auto                                 res = TX(t).Work().exec_prepared("select_dependents", issue_id);
    std::vector<model::DependencyRecord> out;
    for (const auto& row : res) out.push_back(ReadDependency(row));
    return out;
  });
}

Result PgRepository::LockDependencyGraph(Transaction& t) {
  try {
    TX(t).LockGraph();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace issueflow::db::postgres
