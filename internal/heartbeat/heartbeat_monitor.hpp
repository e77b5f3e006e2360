#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/core/session_registry.hpp"
#include "internal/db/api/session_store.hpp"
#include "internal/driver/browser_driver.hpp"
#include "internal/events/event_sink.hpp"

namespace sessionkeeper::heartbeat {

struct HeartbeatOptions {
  std::chrono::milliseconds timeout{60000};
  std::chrono::milliseconds sweep_interval{10000};
  // 0 disables the lifetime cap.
  std::chrono::milliseconds max_session_age{0};
};

struct SweepReport {
  std::size_t scanned      = 0;
  std::size_t abandoned    = 0;
  std::size_t claims_lost  = 0;
  std::size_t store_errors = 0;
};

/*
  Reclaims live sessions whose client stopped heartbeating.

  Only looks at the in-memory registry; records owned by other processes
  are never touched. The store is marked ABANDONED before the handle is
  released, so a browser is never freed under an ACTIVE record.
*/
class HeartbeatMonitor {
 public:
  HeartbeatMonitor(std::shared_ptr<db::SessionStore> store, std::shared_ptr<driver::BrowserDriver> driver,
                   std::shared_ptr<core::SessionRegistry> registry, std::shared_ptr<events::EventSink> events,
                   HeartbeatOptions options);
  ~HeartbeatMonitor();

  HeartbeatMonitor(const HeartbeatMonitor&)            = delete;
  HeartbeatMonitor& operator=(const HeartbeatMonitor&) = delete;

  SweepReport SweepOnce(uint64_t now_ms);

  void Start();
  void Stop();

  const HeartbeatOptions& Options() const {
    return options_;
  }

 private:
  void Loop();

  // Returns the reason the entry is due for reclaim, or nullptr.
  const char* ExpiryReason(const core::LiveSession& session, uint64_t now_ms) const;

  std::shared_ptr<db::SessionStore>      store_;
  std::shared_ptr<driver::BrowserDriver> driver_;
  std::shared_ptr<core::SessionRegistry> registry_;
  std::shared_ptr<events::EventSink>     events_;
  HeartbeatOptions                       options_;

  std::mutex              loop_mutex_;
  std::condition_variable loop_cv_;
  bool                    stop_requested_ = false;
  std::thread             thread_;
};

} // namespace sessionkeeper::heartbeat
