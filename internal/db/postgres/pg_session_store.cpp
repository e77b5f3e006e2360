#include "pg_session_store.hpp"

#include "internal/db/sql/schema.hpp"
#include "internal/util/errors.hpp"

namespace sessionkeeper::db::postgres {

using sessionkeeper::model::SessionStatus;

namespace {

int StatusValue(SessionStatus status) {
  return static_cast<int>(status);
}

model::SessionRecord ReadRow(const pqxx::row& row) {
  model::SessionRecord r;
  r.id         = row[0].c_str();
  r.owner      = row[1].c_str();
  r.target_url = row[2].c_str();
  if (!row[3].is_null()) r.resume_token = row[3].c_str();
  r.status               = static_cast<SessionStatus>(row[4].as<int>());
  r.created_at_ms        = static_cast<uint64_t>(row[5].as<int64_t>());
  r.last_active_at_ms    = static_cast<uint64_t>(row[6].as<int64_t>());
  r.status_changed_at_ms = static_cast<uint64_t>(row[7].as<int64_t>());
  return r;
}

// Maps libpqxx failures onto portable result codes.
Result Translate(const pqxx::failure& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e))
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::Unavailable, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Busy, e.what());
  if (dynamic_cast<const pqxx::query_cancelled*>(&e)) return Result::Err(ErrorCode::Busy, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

std::vector<model::SessionRecord> ReadRows(const pqxx::result& res) {
  std::vector<model::SessionRecord> records;
  records.reserve(res.size());
  for (const auto& row : res) {
    records.push_back(ReadRow(row));
  }
  return records;
}

} // namespace

PgSessionStore::PgSessionStore(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

void PgSessionStore::BootstrapSchema() {
  auto conn = pool_->Acquire();
  try {
    pqxx::work tx(*conn);
    for (const auto& statement : sql::PostgresSchema()) {
      tx.exec(statement);
    }
    tx.commit();
  } catch (const pqxx::failure& e) {
    throw util::StoreUnavailable(std::string("postgres bootstrap: ") + e.what());
  }
}

Result PgSessionStore::GuardedWrite(const std::string& id, ErrorCode on_no_change, const pqxx::result& res, pqxx::work& tx) {
  if (res.affected_rows() == 1) {
    tx.commit();
    return Result::Ok();
  }
  auto exists = tx.exec_prepared("session_exists", id);
  tx.commit();
  if (exists.empty()) return Result::Err(ErrorCode::NotFound, "session not found: " + id);
  return Result::Err(on_no_change, "precondition failed for " + id);
}

Result PgSessionStore::Create(const model::SessionRecord& r) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    tx.exec_prepared("insert_session", r.id, r.owner, r.target_url, r.resume_token, StatusValue(r.status),
                     static_cast<int64_t>(r.created_at_ms), static_cast<int64_t>(r.last_active_at_ms),
                     static_cast<int64_t>(r.status_changed_at_ms));
    tx.commit();
    return Result::Ok();
  } catch (const pqxx::failure& e) {
    return Translate(e);
  } catch (const util::StoreUnavailable& e) {
    return Result::Err(ErrorCode::Unavailable, e.what());
  }
}

Result PgSessionStore::UpdateStatus(const std::string& id, SessionStatus from, SessionStatus to, uint64_t at_ms) {
  if (auto valid = ValidateTransition(from, to); !valid) return valid;

  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    auto res = tx.exec_prepared("cas_status", id, StatusValue(from), StatusValue(to), static_cast<int64_t>(at_ms));
    return GuardedWrite(id, ErrorCode::Conflict, res, tx);
  } catch (const pqxx::failure& e) {
    return Translate(e);
  } catch (const util::StoreUnavailable& e) {
    return Result::Err(ErrorCode::Unavailable, e.what());
  }
}

Result PgSessionStore::Touch(const std::string& id, uint64_t at_ms) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    auto       res = tx.exec_prepared("touch_session", id, static_cast<int64_t>(at_ms));
    return GuardedWrite(id, ErrorCode::NotFound, res, tx);
  } catch (const pqxx::failure& e) {
    return Translate(e);
  } catch (const util::StoreUnavailable& e) {
    return Result::Err(ErrorCode::Unavailable, e.what());
  }
}

Result PgSessionStore::SetResumeToken(const std::string& id, const std::string& token) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    auto       res = tx.exec_prepared("set_resume_token", id, token, StatusValue(SessionStatus::kActive));
    return GuardedWrite(id, ErrorCode::Conflict, res, tx);
  } catch (const pqxx::failure& e) {
    return Translate(e);
  } catch (const util::StoreUnavailable& e) {
    return Result::Err(ErrorCode::Unavailable, e.what());
  }
}

std::optional<model::SessionRecord> PgSessionStore::Get(const std::string& id) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    auto       res = tx.exec_prepared("get_session", id);
    tx.commit();
    if (res.empty()) return std::nullopt;
    return ReadRow(res[0]);
  } catch (const pqxx::failure& e) {
    throw util::StoreUnavailable(std::string("postgres get: ") + e.what());
  }
}

std::vector<model::SessionRecord> PgSessionStore::QueryByStatus(SessionStatus status) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    auto       res = tx.exec_prepared("sessions_by_status", StatusValue(status));
    tx.commit();
    return ReadRows(res);
  } catch (const pqxx::failure& e) {
    throw util::StoreUnavailable(std::string("postgres query: ") + e.what());
  }
}

std::vector<model::SessionRecord> PgSessionStore::ListByOwner(const std::string& owner) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    auto       res = tx.exec_prepared("sessions_by_owner", owner);
    tx.commit();
    return ReadRows(res);
  } catch (const pqxx::failure& e) {
    throw util::StoreUnavailable(std::string("postgres list: ") + e.what());
  }
}

} // namespace sessionkeeper::db::postgres
