#pragma once

#include <array>

namespace issueflow::db::sql {

/*
  Bootstrap DDL, applied idempotently by the factory and the test suites.

  status is TEXT with a CHECK so that even a raw SQL write cannot store a
  value outside the persisted set. The dependency primary key is the
  (issue_id, depends_on_id, type) triple.
*/

inline constexpr int kSchemaVersion = 1;

inline constexpr std::array<const char*, 7> kSqliteSchema = {
    "CREATE TABLE IF NOT EXISTS issues ("
    " id TEXT PRIMARY KEY,"
    " title TEXT NOT NULL,"
    " description TEXT NOT NULL DEFAULT '',"
    " notes TEXT NOT NULL DEFAULT '',"
    " metadata TEXT NOT NULL DEFAULT '',"
    " issue_type TEXT NOT NULL,"
    " priority INTEGER NOT NULL,"
    " status TEXT NOT NULL CHECK (status IN ('open','in_progress','deferred','closed')),"
    " assignee TEXT NOT NULL DEFAULT '',"
    " defer_until_ms INTEGER NOT NULL DEFAULT 0,"
    " close_reason TEXT NOT NULL DEFAULT '',"
    " verification TEXT NOT NULL DEFAULT '',"
    " created_at_ms INTEGER NOT NULL,"
    " updated_at_ms INTEGER NOT NULL,"
    " closed_at_ms INTEGER NOT NULL DEFAULT 0,"
    " seq INTEGER NOT NULL UNIQUE,"
    " version INTEGER NOT NULL);",

    "CREATE TABLE IF NOT EXISTS labels ("
    " issue_id TEXT NOT NULL REFERENCES issues(id) ON DELETE CASCADE,"
    " label TEXT NOT NULL,"
    " PRIMARY KEY (issue_id, label));",

    "CREATE TABLE IF NOT EXISTS dependencies ("
    " issue_id TEXT NOT NULL REFERENCES issues(id) ON DELETE CASCADE,"
    " depends_on_id TEXT NOT NULL REFERENCES issues(id) ON DELETE CASCADE,"
    " type TEXT NOT NULL,"
    " created_at_ms INTEGER NOT NULL,"
    " note TEXT NOT NULL DEFAULT '',"
    " PRIMARY KEY (issue_id, depends_on_id, type),"
    " CHECK (issue_id <> depends_on_id));",

    "CREATE INDEX IF NOT EXISTS idx_dependencies_depends_on ON dependencies(depends_on_id);",

    "CREATE INDEX IF NOT EXISTS idx_issues_status ON issues(status, priority, seq);",

    "CREATE TABLE IF NOT EXISTS child_counters (parent_id TEXT PRIMARY KEY, last_child INTEGER NOT NULL);",

    "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
};

inline constexpr std::array<const char*, 7> kPostgresSchema = {
    "CREATE TABLE IF NOT EXISTS issues ("
    " id TEXT PRIMARY KEY,"
    " title TEXT NOT NULL,"
    " description TEXT NOT NULL DEFAULT '',"
    " notes TEXT NOT NULL DEFAULT '',"
    " metadata TEXT NOT NULL DEFAULT '',"
    " issue_type TEXT NOT NULL,"
    " priority SMALLINT NOT NULL,"
    " status TEXT NOT NULL CHECK (status IN ('open','in_progress','deferred','closed')),"
    " assignee TEXT NOT NULL DEFAULT '',"
    " defer_until_ms BIGINT NOT NULL DEFAULT 0,"
    " close_reason TEXT NOT NULL DEFAULT '',"
    " verification TEXT NOT NULL DEFAULT '',"
    " created_at_ms BIGINT NOT NULL,"
    " updated_at_ms BIGINT NOT NULL,"
    " closed_at_ms BIGINT NOT NULL DEFAULT 0,"
    " seq BIGSERIAL UNIQUE,"
    " version BIGINT NOT NULL);",

    "CREATE TABLE IF NOT EXISTS labels ("
    " issue_id TEXT NOT NULL REFERENCES issues(id) ON DELETE CASCADE,"
    " label TEXT NOT NULL,"
    " PRIMARY KEY (issue_id, label));",

    "CREATE TABLE IF NOT EXISTS dependencies ("
    " issue_id TEXT NOT NULL REFERENCES issues(id) ON DELETE CASCADE,"
    " depends_on_id TEXT NOT NULL REFERENCES issues(id) ON DELETE CASCADE,"
    " type TEXT NOT NULL,"
    " created_at_ms BIGINT NOT NULL,"
    " note TEXT NOT NULL DEFAULT '',"
    " PRIMARY KEY (issue_id, depends_on_id, type),"
    " CHECK (issue_id <> depends_on_id));",

    "CREATE INDEX IF NOT EXISTS idx_dependencies_depends_on ON dependencies(depends_on_id);",

    "CREATE INDEX IF NOT EXISTS idx_issues_status ON issues(status, priority, seq);",

    "CREATE TABLE IF NOT EXISTS child_counters (parent_id TEXT PRIMARY KEY, last_child BIGINT NOT NULL);",

    "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ NOT NULL DEFAULT now());",
};

} // namespace issueflow::db::sql
