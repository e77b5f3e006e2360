#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace sessionkeeper::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw util::StoreUnavailable(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, int busy_timeout_ms) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StoreUnavailable("sqlite open " + path_ + ": " + msg);
  }

  try {
    Configure(busy_timeout_ms);
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw util::StoreUnavailable(msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::Configure(int busy_timeout_ms) {
  // IMPORTANT: WAL lets recovery scans read while another process writes
  Exec("PRAGMA journal_mode=WAL;");

  // status transitions must survive a crash of this process
  Exec("PRAGMA synchronous=FULL;");

  // wait for locks held by peer processes instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, busy_timeout_ms), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace sessionkeeper::db::sqlite
