#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/session_store.hpp"

namespace sessionkeeper::db::memory {

/*
  In-process SessionStore.

  Every operation runs under one mutex, so compare-and-set is trivially
  atomic. Contents do not survive a restart; use it for tests and
  single-node development.
*/
class MemorySessionStore final : public SessionStore {
 public:
  MemorySessionStore() = default;

  Result Create(const model::SessionRecord& record) override;

  Result UpdateStatus(const std::string& id, sessionkeeper::model::SessionStatus from, sessionkeeper::model::SessionStatus to,
                      uint64_t at_ms) override;

  Result Touch(const std::string& id, uint64_t at_ms) override;

  Result SetResumeToken(const std::string& id, const std::string& token) override;

  std::optional<model::SessionRecord> Get(const std::string& id) override;

  std::vector<model::SessionRecord> QueryByStatus(sessionkeeper::model::SessionStatus status) override;

  std::vector<model::SessionRecord> ListByOwner(const std::string& owner) override;

 private:
  std::mutex                                            mutex_;
  std::unordered_map<std::string, model::SessionRecord> sessions_;
};

} // namespace sessionkeeper::db::memory
