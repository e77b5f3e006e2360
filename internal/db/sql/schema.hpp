#pragma once

#include <string>
#include <vector>

namespace sessionkeeper::db::sql {

/*
  Bootstrap DDL per backend. Statements are idempotent and run in order
  every time a durable store is built.

  status holds model::SessionStatus numeric values.
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS sessions ("
      "id TEXT PRIMARY KEY, "
      "owner TEXT NOT NULL, "
      "target_url TEXT NOT NULL, "
      "resume_token TEXT, "
      "status INTEGER NOT NULL, "
      "created_at_ms INTEGER NOT NULL, "
      "last_active_at_ms INTEGER NOT NULL, "
      "status_changed_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS sessions_status_idx ON sessions(status);",
      "CREATE INDEX IF NOT EXISTS sessions_owner_idx ON sessions(owner);",
  };
  return kStatements;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS sessions ("
      "id TEXT PRIMARY KEY, "
      "owner TEXT NOT NULL, "
      "target_url TEXT NOT NULL, "
      "resume_token TEXT, "
      "status SMALLINT NOT NULL, "
      "created_at_ms BIGINT NOT NULL, "
      "last_active_at_ms BIGINT NOT NULL, "
      "status_changed_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS sessions_status_idx ON sessions(status);",
      "CREATE INDEX IF NOT EXISTS sessions_owner_idx ON sessions(owner);",
  };
  return kStatements;
}

} // namespace sessionkeeper::db::sql
