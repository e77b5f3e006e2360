#include "pg_pool.hpp"

#include "internal/util/errors.hpp"

namespace sessionkeeper::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections, int statement_timeout_ms,
               std::chrono::milliseconds acquire_timeout)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections),
      statement_timeout_ms_(statement_timeout_ms),
      acquire_timeout_(acquire_timeout) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);

  const bool ready = cv_.wait_for(lock, acquire_timeout_, [this] {
    return !idle_.empty() || live_connections_ < max_connections_;
  });
  if (!ready) throw util::StoreUnavailable("postgres pool exhausted");

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    if (conn->is_open()) return Wrap(conn.release());
    // dropped by the server; fall through and reconnect in its slot
    --live_connections_;
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareConnection(*conn);
    return Wrap(conn.release());
  } catch (const pqxx::failure& e) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw util::StoreUnavailable(std::string("postgres connect: ") + e.what());
  }
}

void PgPool::PrepareConnection(pqxx::connection& conn) const {
  {
    pqxx::nontransaction tx(conn);
    tx.exec("SET statement_timeout = " + std::to_string(statement_timeout_ms_));
  }

  conn.prepare("insert_session",
               "INSERT INTO sessions(id,owner,target_url,resume_token,status,created_at_ms,last_active_at_ms,status_changed_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8)");

  conn.prepare("cas_status", "UPDATE sessions SET status=$3, status_changed_at_ms=$4 WHERE id=$1 AND status=$2");

  conn.prepare("touch_session", "UPDATE sessions SET last_active_at_ms=GREATEST(last_active_at_ms, $2) WHERE id=$1");

  conn.prepare("set_resume_token", "UPDATE sessions SET resume_token=$2 WHERE id=$1 AND status=$3");

  conn.prepare("session_exists", "SELECT 1 FROM sessions WHERE id=$1");

  conn.prepare("get_session",
               "SELECT id,owner,target_url,resume_token,status,created_at_ms,last_active_at_ms,status_changed_at_ms "
               "FROM sessions WHERE id=$1");

  conn.prepare("sessions_by_status",
               "SELECT id,owner,target_url,resume_token,status,created_at_ms,last_active_at_ms,status_changed_at_ms "
               "FROM sessions WHERE status=$1 ORDER BY last_active_at_ms, id");

  conn.prepare("sessions_by_owner",
               "SELECT id,owner,target_url,resume_token,status,created_at_ms,last_active_at_ms,status_changed_at_ms "
               "FROM sessions WHERE owner=$1 ORDER BY created_at_ms, id");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace sessionkeeper::db::postgres
