#pragma once

#include <memory>

#include "internal/db/api/session_store.hpp"
#include "pg_pool.hpp"

namespace sessionkeeper::db::postgres {

/*
  PostgreSQL-backed SessionStore for multi-node deployments.

  Each operation is one autocommitted statement on a pooled connection.
  The status CAS relies on the row lock UPDATE takes plus the affected-row
  count, so concurrent claimers on different nodes see exactly one winner.
*/
class PgSessionStore final : public SessionStore {
 public:
  explicit PgSessionStore(std::shared_ptr<PgPool> pool);

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
  Result GuardedWrite(const std::string& id, ErrorCode on_no_change, const pqxx::result& res, pqxx::work& tx);

  std::shared_ptr<PgPool> pool_;
};

} // namespace sessionkeeper::db::postgres
