#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/session_store.hpp"
#include "sqlite_db.hpp"

namespace sessionkeeper::db::sqlite {

/*
  SQLite-backed SessionStore.

  Several processes may open the same database file; the status CAS is a
  single UPDATE guarded by "WHERE status = ?" and its changed-row count.

  Statements on the shared connection are serialized by mutex_ so that
  sqlite3_changes() and sqlite3_errmsg() belong to the statement just run.
*/
class SqliteSessionStore final : public SessionStore {
 public:
  explicit SqliteSessionStore(std::shared_ptr<SqliteDB> db);

  // Creates the sessions table and indexes if missing.
  void BootstrapSchema();

  Result Create(const model::SessionRecord& record) override;

  Result UpdateStatus(const std::string& id, sessionkeeper::model::SessionStatus from, sessionkeeper::model::SessionStatus to,
                      uint64_t at_ms) override;

  Result Touch(const std::string& id, uint64_t at_ms) override;

  Result SetResumeToken(const std::string& id, const std::string& token) override;

  std::optional<model::SessionRecord> Get(const std::string& id) override;

  std::vector<model::SessionRecord> QueryByStatus(sessionkeeper::model::SessionStatus status) override;

  std::vector<model::SessionRecord> ListByOwner(const std::string& owner) override;

 private:
  static Result Translate(sqlite3* db, int rc);

  // Runs a single-row write; distinguishes NotFound from a failed precondition.
  Result ExecuteGuardedWrite(sqlite3_stmt* st, const std::string& id, ErrorCode on_no_change, const char* what);

  bool Exists(const std::string& id);

  std::shared_ptr<SqliteDB> db_;
  std::mutex                mutex_;
};

} // namespace sessionkeeper::db::sqlite
