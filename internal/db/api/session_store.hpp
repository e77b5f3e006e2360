#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/model/session_record.hpp"
#include "internal/model/state_machine.hpp"

namespace sessionkeeper::db {

/*
  Durable session metadata store.

  CRITICAL GUARANTEES:

  - Every operation touches exactly one record and either fully applies
    or not at all.
  - UpdateStatus is a compare-and-set on the status column. It is the only
    concurrency-control primitive the engine relies on, within one process
    and across processes sharing the store.
  - Touch never moves last_active_at_ms backwards.

  Writes report failures as Result codes:
    Conflict      precondition lost (status != from)
    NotFound      no such id
    Busy/IOError  backend unavailable, retryable

  Reads throw util::StoreUnavailable when the backend cannot answer.
*/

class SessionStore {
 public:
  virtual ~SessionStore() = default;

  virtual Result Create(const model::SessionRecord& record) = 0;

  virtual Result UpdateStatus(const std::string& id, sessionkeeper::model::SessionStatus from,
                              sessionkeeper::model::SessionStatus to, uint64_t at_ms) = 0;

  virtual Result Touch(const std::string& id, uint64_t at_ms) = 0;

  // Only applies while the record is ACTIVE.
  virtual Result SetResumeToken(const std::string& id, const std::string& token) = 0;

  virtual std::optional<model::SessionRecord> Get(const std::string& id) = 0;

  virtual std::vector<model::SessionRecord> QueryByStatus(sessionkeeper::model::SessionStatus status) = 0;

  virtual std::vector<model::SessionRecord> ListByOwner(const std::string& owner) = 0;
};

// Shared by all backends so an illegal transition never reaches storage.
inline Result ValidateTransition(sessionkeeper::model::SessionStatus from, sessionkeeper::model::SessionStatus to) {
  if (!sessionkeeper::model::CanTransition(from, to)) {
    return Result::Err(ErrorCode::ConstraintViolation, "illegal session transition " + std::string(sessionkeeper::model::ToString(from)) +
                                                           " -> " + std::string(sessionkeeper::model::ToString(to)));
  }
  return Result::Ok();
}

} // namespace sessionkeeper::db
