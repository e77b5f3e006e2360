#include "internal/core/session_registry.hpp"

#include <algorithm>

#include "internal/observability/spans.hpp"

namespace sessionkeeper::core {

SessionLock::SessionLock(SessionRegistry* registry, std::string id, std::shared_ptr<std::mutex> mutex)
    : registry_(registry), id_(std::move(id)), mutex_(std::move(mutex)), lock_(*mutex_) {
}

SessionLock::SessionLock(SessionLock&& other) noexcept
    : registry_(other.registry_), id_(std::move(other.id_)), mutex_(std::move(other.mutex_)), lock_(std::move(other.lock_)) {
  other.registry_ = nullptr;
}

SessionLock::~SessionLock() {
  if (!registry_ || !mutex_) return;
  lock_.unlock();
  registry_->ReleaseLock(id_, mutex_);
}

SessionLock SessionRegistry::Lock(const std::string& id) {
  std::shared_ptr<std::mutex> mutex;
  {
    std::lock_guard<std::mutex> guard(locks_guard_);
    auto&                       slot = locks_[id];
    if (!slot) {
      slot = std::make_shared<std::mutex>();
    }
    mutex = slot;
  }
  return SessionLock(this, id, std::move(mutex));
}

void SessionRegistry::ReleaseLock(const std::string& id, const std::shared_ptr<std::mutex>& mutex) {
  std::lock_guard<std::mutex> guard(locks_guard_);
  auto                        it = locks_.find(id);
  // New holders only copy the pointer under locks_guard_, so two owners
  // (the table and the releasing lock) means nobody else is waiting.
  if (it != locks_.end() && it->second == mutex && mutex.use_count() == 2) {
    locks_.erase(it);
  }
}

std::optional<LiveSession> SessionRegistry::Find(const std::string& id) const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  auto                        it = sessions_.find(id);
  if (it == sessions_.end()) return std::nullopt;
  return it->second;
}

bool SessionRegistry::Contains(const std::string& id) const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return sessions_.contains(id);
}

void SessionRegistry::Put(LiveSession session) {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  auto                        id = session.record.id;
  sessions_.insert_or_assign(std::move(id), std::move(session));
  observability::Metrics::Instance().SetLiveSessions(sessions_.size());
}

std::optional<LiveSession> SessionRegistry::Erase(const std::string& id) {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  auto                        it = sessions_.find(id);
  if (it == sessions_.end()) return std::nullopt;
  LiveSession removed = std::move(it->second);
  sessions_.erase(it);
  observability::Metrics::Instance().SetLiveSessions(sessions_.size());
  return removed;
}

bool SessionRegistry::Touch(const std::string& id, uint64_t at_ms) {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  auto                        it = sessions_.find(id);
  if (it == sessions_.end()) return false;
  it->second.record.last_active_at_ms = std::max(it->second.record.last_active_at_ms, at_ms);
  return true;
}

bool SessionRegistry::SetResumeToken(const std::string& id, const std::string& token) {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  auto                        it = sessions_.find(id);
  if (it == sessions_.end()) return false;
  it->second.record.resume_token = token;
  return true;
}

std::vector<LiveSession> SessionRegistry::Snapshot() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  std::vector<LiveSession>    out;
  out.reserve(sessions_.size());
  for (const auto& [_, session] : sessions_) {
    out.push_back(session);
  }
  return out;
}

std::size_t SessionRegistry::Size() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return sessions_.size();
}

std::size_t SessionRegistry::LockTableSize() const {
  std::lock_guard<std::mutex> guard(locks_guard_);
  return locks_.size();
}

} // namespace sessionkeeper::core
