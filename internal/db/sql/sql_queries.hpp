#pragma once

namespace issueflow::db::sql {

/*
  Canonical SQL shared by the backends.

  Column order of ISSUE_COLUMNS is the order every row decoder expects.
  Statements below use SQLite placeholders; the postgres pool prepares
  $n equivalents from the same column list.
*/

#define ISSUEFLOW_ISSUE_COLUMNS                                                                                               \
  "id,title,description,notes,metadata,issue_type,priority,status,assignee,defer_until_ms,close_reason,verification,"        \
  "created_at_ms,updated_at_ms,closed_at_ms,seq,version"

#define ISSUEFLOW_DEPENDENCY_COLUMNS "issue_id,depends_on_id,type,created_at_ms,note"

static constexpr const char* INSERT_ISSUE =
    "INSERT INTO issues(id,title,description,notes,metadata,issue_type,priority,status,assignee,defer_until_ms,"
    "close_reason,verification,created_at_ms,updated_at_ms,closed_at_ms,seq,version)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,(SELECT COALESCE(MAX(seq),0)+1 FROM issues),1)"
    " RETURNING seq;";

static constexpr const char* SELECT_ISSUE = "SELECT " ISSUEFLOW_ISSUE_COLUMNS " FROM issues WHERE id=?;";

static constexpr const char* UPDATE_ISSUE =
    "UPDATE issues SET title=?,description=?,notes=?,metadata=?,issue_type=?,priority=?,status=?,assignee=?,"
    "defer_until_ms=?,close_reason=?,verification=?,updated_at_ms=?,closed_at_ms=?,version=version+1"
    " WHERE id=? AND version=?;";

static constexpr const char* CAS_STATUS =
    "UPDATE issues SET status=?,assignee=?,close_reason=?,verification=?,closed_at_ms=?,notes=COALESCE(?,notes),"
    "updated_at_ms=?,version=version+1"
    " WHERE id=? AND status=? AND assignee=?;";

static constexpr const char* DELETE_ISSUE = "DELETE FROM issues WHERE id=?;";

static constexpr const char* ISSUE_EXISTS = "SELECT 1 FROM issues WHERE id=?;";

static constexpr const char* NEXT_CHILD_NUMBER =
    "INSERT INTO child_counters(parent_id,last_child) VALUES(?,1)"
    " ON CONFLICT(parent_id) DO UPDATE SET last_child=last_child+1"
    " RETURNING last_child;";

// labels

static constexpr const char* INSERT_LABEL = "INSERT INTO labels(issue_id,label) VALUES(?,?) ON CONFLICT(issue_id,label) DO NOTHING;";

static constexpr const char* DELETE_LABEL = "DELETE FROM labels WHERE issue_id=? AND label=?;";

static constexpr const char* SELECT_LABELS = "SELECT label FROM labels WHERE issue_id=? ORDER BY label;";

// dependencies

static constexpr const char* INSERT_DEPENDENCY =
    "INSERT INTO dependencies(" ISSUEFLOW_DEPENDENCY_COLUMNS ") VALUES(?,?,?,?,?)"
    " ON CONFLICT(issue_id,depends_on_id,type) DO NOTHING;";

static constexpr const char* DELETE_DEPENDENCY = "DELETE FROM dependencies WHERE issue_id=? AND depends_on_id=? AND type=?;";

static constexpr const char* SELECT_DEPENDENCIES =
    "SELECT " ISSUEFLOW_DEPENDENCY_COLUMNS " FROM dependencies WHERE issue_id=? ORDER BY depends_on_id,type;";

static constexpr const char* SELECT_DEPENDENTS =
    "SELECT " ISSUEFLOW_DEPENDENCY_COLUMNS " FROM dependencies WHERE depends_on_id=? ORDER BY issue_id,type;";

} // namespace issueflow::db::sql
