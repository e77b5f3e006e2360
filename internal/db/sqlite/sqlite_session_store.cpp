#include "sqlite_session_store.hpp"

#include "internal/db/sql/schema.hpp"
#include "internal/util/errors.hpp"

namespace sessionkeeper::db::sqlite {

using sessionkeeper::model::SessionStatus;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

constexpr const char* kSelectColumns =
    "SELECT id,owner,target_url,resume_token,status,created_at_ms,last_active_at_ms,status_changed_at_ms FROM sessions";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindStatus(sqlite3_stmt* st, int idx, SessionStatus status) {
  sqlite3_bind_int(st, idx, static_cast<int>(status));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

model::SessionRecord ReadRow(sqlite3_stmt* st) {
  model::SessionRecord r;
  r.id         = ColText(st, 0);
  r.owner      = ColText(st, 1);
  r.target_url = ColText(st, 2);
  if (sqlite3_column_type(st, 3) != SQLITE_NULL) r.resume_token = ColText(st, 3);
  r.status               = static_cast<SessionStatus>(sqlite3_column_int(st, 4));
  r.created_at_ms        = ColU64(st, 5);
  r.last_active_at_ms    = ColU64(st, 6);
  r.status_changed_at_ms = ColU64(st, 7);
  return r;
}

} // namespace

SqliteSessionStore::SqliteSessionStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteSessionStore::BootstrapSchema() {
  std::lock_guard lock(mutex_);
  for (const auto& statement : sql::SqliteSchema()) {
    db_->Exec(statement);
  }
}

Result SqliteSessionStore::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

bool SqliteSessionStore::Exists(const std::string& id) {
  auto*         db = db_->Handle();
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, "SELECT 1 FROM sessions WHERE id=?;", -1, &raw, nullptr) != SQLITE_OK) {
    throw util::StoreUnavailable(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  StmtPtr st(raw, &sqlite3_finalize);
  BindText(st.get(), 1, id);
  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw util::StoreUnavailable(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

Result SqliteSessionStore::ExecuteGuardedWrite(sqlite3_stmt* st, const std::string& id, ErrorCode on_no_change,
                                               const char* what) {
  auto* db = db_->Handle();
  int   rc = sqlite3_step(st);
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 1) return Result::Ok();

  try {
    if (!Exists(id)) return Result::Err(ErrorCode::NotFound, "session not found: " + id);
  } catch (const util::StoreUnavailable& e) {
    return Result::Err(ErrorCode::Unavailable, e.what());
  }
  return Result::Err(on_no_change, std::string(what) + " precondition failed for " + id);
}

Result SqliteSessionStore::Create(const model::SessionRecord& r) {
  std::lock_guard lock(mutex_);
  auto*           db = db_->Handle();

  const char* sql =
      "INSERT INTO sessions(id,owner,target_url,resume_token,status,created_at_ms,last_active_at_ms,status_changed_at_ms) "
      "VALUES(?,?,?,?,?,?,?,?);";

  sqlite3_stmt* raw = nullptr;
  if (int rc = sqlite3_prepare_v2(db, sql, -1, &raw, nullptr); rc != SQLITE_OK) return Translate(db, rc);
  StmtPtr st(raw, &sqlite3_finalize);

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.owner);
  BindText(st.get(), 3, r.target_url);
  if (r.resume_token) {
    BindText(st.get(), 4, *r.resume_token);
  } else {
    sqlite3_bind_null(st.get(), 4);
  }
  BindStatus(st.get(), 5, r.status);
  BindU64(st.get(), 6, r.created_at_ms);
  BindU64(st.get(), 7, r.last_active_at_ms);
  BindU64(st.get(), 8, r.status_changed_at_ms);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xff) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, "session exists: " + r.id);
  return Translate(db, rc);
}

Result SqliteSessionStore::UpdateStatus(const std::string& id, SessionStatus from, SessionStatus to, uint64_t at_ms) {
  if (auto valid = ValidateTransition(from, to); !valid) return valid;

  std::lock_guard lock(mutex_);
  auto*           db = db_->Handle();

  // The WHERE clause is the claim: only one writer observes a changed row.
  const char* sql = "UPDATE sessions SET status=?, status_changed_at_ms=? WHERE id=? AND status=?;";

  sqlite3_stmt* raw = nullptr;
  if (int rc = sqlite3_prepare_v2(db, sql, -1, &raw, nullptr); rc != SQLITE_OK) return Translate(db, rc);
  StmtPtr st(raw, &sqlite3_finalize);

  BindStatus(st.get(), 1, to);
  BindU64(st.get(), 2, at_ms);
  BindText(st.get(), 3, id);
  BindStatus(st.get(), 4, from);

  return ExecuteGuardedWrite(st.get(), id, ErrorCode::Conflict, "status update");
}

Result SqliteSessionStore::Touch(const std::string& id, uint64_t at_ms) {
  std::lock_guard lock(mutex_);
  auto*           db = db_->Handle();

  const char* sql = "UPDATE sessions SET last_active_at_ms=MAX(last_active_at_ms, ?) WHERE id=?;";

  sqlite3_stmt* raw = nullptr;
  if (int rc = sqlite3_prepare_v2(db, sql, -1, &raw, nullptr); rc != SQLITE_OK) return Translate(db, rc);
  StmtPtr st(raw, &sqlite3_finalize);

  BindU64(st.get(), 1, at_ms);
  BindText(st.get(), 2, id);

  return ExecuteGuardedWrite(st.get(), id, ErrorCode::NotFound, "touch");
}

Result SqliteSessionStore::SetResumeToken(const std::string& id, const std::string& token) {
  std::lock_guard lock(mutex_);
  auto*           db = db_->Handle();

  const char* sql = "UPDATE sessions SET resume_token=? WHERE id=? AND status=?;";

  sqlite3_stmt* raw = nullptr;
  if (int rc = sqlite3_prepare_v2(db, sql, -1, &raw, nullptr); rc != SQLITE_OK) return Translate(db, rc);
  StmtPtr st(raw, &sqlite3_finalize);

  BindText(st.get(), 1, token);
  BindText(st.get(), 2, id);
  BindStatus(st.get(), 3, SessionStatus::kActive);

  return ExecuteGuardedWrite(st.get(), id, ErrorCode::Conflict, "resume token update");
}

std::optional<model::SessionRecord> SqliteSessionStore::Get(const std::string& id) {
  std::lock_guard lock(mutex_);
  StmtPtr         st(db_->Prepare(std::string(kSelectColumns) + " WHERE id=?;"), &sqlite3_finalize);
  BindText(st.get(), 1, id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw util::StoreUnavailable(std::string("sqlite get: ") + sqlite3_errmsg(db_->Handle()));
  return ReadRow(st.get());
}

std::vector<model::SessionRecord> SqliteSessionStore::QueryByStatus(SessionStatus status) {
  std::lock_guard lock(mutex_);
  StmtPtr st(db_->Prepare(std::string(kSelectColumns) + " WHERE status=? ORDER BY last_active_at_ms, id;"), &sqlite3_finalize);
  BindStatus(st.get(), 1, status);

  std::vector<model::SessionRecord> records;
  int                               rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    records.push_back(ReadRow(st.get()));
  }
  if (rc != SQLITE_DONE) throw util::StoreUnavailable(std::string("sqlite query: ") + sqlite3_errmsg(db_->Handle()));
  return records;
}

std::vector<model::SessionRecord> SqliteSessionStore::ListByOwner(const std::string& owner) {
  std::lock_guard lock(mutex_);
  StmtPtr st(db_->Prepare(std::string(kSelectColumns) + " WHERE owner=? ORDER BY created_at_ms, id;"), &sqlite3_finalize);
  BindText(st.get(), 1, owner);

  std::vector<model::SessionRecord> records;
  int                               rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    records.push_back(ReadRow(st.get()));
  }
  if (rc != SQLITE_DONE) throw util::StoreUnavailable(std::string("sqlite list: ") + sqlite3_errmsg(db_->Handle()));
  return records;
}

} // namespace sessionkeeper::db::sqlite
