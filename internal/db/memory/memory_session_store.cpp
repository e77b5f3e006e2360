#include "memory_session_store.hpp"

#include <algorithm>

namespace sessionkeeper::db::memory {

using sessionkeeper::model::SessionStatus;

Result MemorySessionStore::Create(const model::SessionRecord& record) {
  std::lock_guard lock(mutex_);
  if (sessions_.contains(record.id)) return Result::Err(ErrorCode::AlreadyExists, "session exists: " + record.id);
  sessions_.emplace(record.id, record);
  return Result::Ok();
}

Result MemorySessionStore::UpdateStatus(const std::string& id, SessionStatus from, SessionStatus to, uint64_t at_ms) {
  if (auto valid = ValidateTransition(from, to); !valid) return valid;

  std::lock_guard lock(mutex_);
  auto            it = sessions_.find(id);
  if (it == sessions_.end()) return Result::Err(ErrorCode::NotFound, "session not found: " + id);

  auto& record = it->second;
  if (record.status != from) {
    return Result::Err(ErrorCode::Conflict, "session " + id + " is " + std::string(sessionkeeper::model::ToString(record.status)));
  }

  record.status               = to;
  record.status_changed_at_ms = at_ms;
  return Result::Ok();
}

Result MemorySessionStore::Touch(const std::string& id, uint64_t at_ms) {
  std::lock_guard lock(mutex_);
  auto            it = sessions_.find(id);
  if (it == sessions_.end()) return Result::Err(ErrorCode::NotFound, "session not found: " + id);
  it->second.last_active_at_ms = std::max(it->second.last_active_at_ms, at_ms);
  return Result::Ok();
}

Result MemorySessionStore::SetResumeToken(const std::string& id, const std::string& token) {
  std::lock_guard lock(mutex_);
  auto            it = sessions_.find(id);
  if (it == sessions_.end()) return Result::Err(ErrorCode::NotFound, "session not found: " + id);
  if (it->second.status != SessionStatus::kActive) return Result::Err(ErrorCode::Conflict, "session not active: " + id);
  it->second.resume_token = token;
  return Result::Ok();
}

std::optional<model::SessionRecord> MemorySessionStore::Get(const std::string& id) {
  std::lock_guard lock(mutex_);
  auto            it = sessions_.find(id);
  if (it == sessions_.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SessionRecord> MemorySessionStore::QueryByStatus(SessionStatus status) {
  std::lock_guard                   lock(mutex_);
  std::vector<model::SessionRecord> records;
  for (const auto& [_, record] : sessions_) {
    if (record.status == status) records.push_back(record);
  }
  return records;
}

std::vector<model::SessionRecord> MemorySessionStore::ListByOwner(const std::string& owner) {
  std::lock_guard                   lock(mutex_);
  std::vector<model::SessionRecord> records;
  for (const auto& [_, record] : sessions_) {
    if (record.owner == owner) records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.id < b.id;
  });
  return records;
}

} // namespace sessionkeeper::db::memory
