#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/session_registry.hpp"
#include "internal/db/api/session_store.hpp"
#include "internal/driver/browser_driver.hpp"
#include "internal/events/event_sink.hpp"

namespace sessionkeeper::core {

struct SessionManagerOptions {
  // 0 means unlimited.
  std::size_t               max_sessions = 0;
  int                       spin_attempts = 3;
  std::chrono::milliseconds spin_backoff{2000};
  std::chrono::milliseconds spin_timeout{30000};
};

// A record as clients see it; view_url is set while this process owns the handle.
struct SessionView {
  db::model::SessionRecord   record;
  std::optional<std::string> view_url;
};

enum class TerminateResult {
  kTerminated,
  kAlreadyTerminated,
};

/*
  Owns every client-visible session operation.

  Normal-path writer to the store and the registry. All calls on one id
  serialize on the registry lock for that id.

  Errors:
    util::NotFound / InvalidArgument / InvalidState / ResourceExhausted
    util::StoreUnavailable   retryable, no transition happened
    util::DriverSpinFailure  no record was created
*/
class SessionManager {
 public:
  SessionManager(std::shared_ptr<db::SessionStore> store, std::shared_ptr<driver::BrowserDriver> driver,
                 std::shared_ptr<SessionRegistry> registry, std::shared_ptr<events::EventSink> events,
                 SessionManagerOptions options = {});

  SessionView StartSession(const std::string& owner, const std::string& target_url);

  void Heartbeat(const std::string& id);

  void UpdateResumeToken(const std::string& id, const std::string& token);

  model::SessionStatus GetStatus(const std::string& id);

  SessionView GetSession(const std::string& id);

  std::vector<SessionView> ListSessions(const std::string& owner);

  TerminateResult Terminate(const std::string& id, model::SessionStatus outcome);

  std::size_t LiveCount() const;

 private:
  driver::DriverHandle SpinWithRetry(const std::string& target_url);

  std::shared_ptr<db::SessionStore>      store_;
  std::shared_ptr<driver::BrowserDriver> driver_;
  std::shared_ptr<SessionRegistry>       registry_;
  std::shared_ptr<events::EventSink>     events_;
  SessionManagerOptions                  options_;

  // Starts admitted past the capacity check but not yet registered.
  mutable std::mutex capacity_mutex_;
  std::size_t        pending_starts_ = 0;
};

} // namespace sessionkeeper::core
