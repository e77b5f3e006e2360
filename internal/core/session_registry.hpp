#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/model/session_record.hpp"
#include "internal/driver/browser_driver.hpp"

namespace sessionkeeper::core {

/*
  A session owned by this process: its record mirror plus the live handle.
  record.status is always ACTIVE while the entry exists.
*/
struct LiveSession {
  db::model::SessionRecord record;
  driver::DriverHandle     handle;
};

class SessionRegistry;

/*
  Exclusive hold on one session id. Movable, released on destruction.
*/
class SessionLock {
 public:
  SessionLock(SessionLock&&) noexcept;
  SessionLock& operator=(SessionLock&&) = delete;
  SessionLock(const SessionLock&)       = delete;
  ~SessionLock();

 private:
  friend class SessionRegistry;
  SessionLock(SessionRegistry* registry, std::string id, std::shared_ptr<std::mutex> mutex);

  SessionRegistry*             registry_;
  std::string                  id_;
  std::shared_ptr<std::mutex>  mutex_;
  std::unique_lock<std::mutex> lock_;
};

/*
  In-memory registry of live sessions plus the per-session lock table.

  Shared by SessionManager, HeartbeatMonitor and RecoveryCoordinator.
  Every mutation of one session's entry happens while holding
  Lock(id); the map itself is guarded separately so that distinct ids
  never block each other.
*/
class SessionRegistry {
 public:
  SessionRegistry() = default;

  SessionRegistry(const SessionRegistry&)            = delete;
  SessionRegistry& operator=(const SessionRegistry&) = delete;

  SessionLock Lock(const std::string& id);

  std::optional<LiveSession> Find(const std::string& id) const;
  bool                       Contains(const std::string& id) const;

  void                       Put(LiveSession session);
  std::optional<LiveSession> Erase(const std::string& id);

  // Advances last_active_at_ms to max(current, at_ms). False if absent.
  bool Touch(const std::string& id, uint64_t at_ms);
  bool SetResumeToken(const std::string& id, const std::string& token);

  std::vector<LiveSession> Snapshot() const;
  std::size_t              Size() const;

  // Lock table entries currently allocated; exposed for tests.
  std::size_t LockTableSize() const;

 private:
  friend class SessionLock;
  void ReleaseLock(const std::string& id, const std::shared_ptr<std::mutex>& mutex);

  mutable std::mutex                           sessions_mutex_;
  std::unordered_map<std::string, LiveSession> sessions_;

  mutable std::mutex                                           locks_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
};

} // namespace sessionkeeper::core
