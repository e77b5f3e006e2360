#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/core/session_registry.hpp"
#include "internal/db/api/session_store.hpp"
#include "internal/driver/browser_driver.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/notify/owner_notifier.hpp"

namespace sessionkeeper::observability {
class SpanScope;
}

namespace sessionkeeper::recovery {

struct RecoveryOptions {
  std::size_t               parallelism = 4;
  std::chrono::milliseconds resume_timeout{60000};
  // 0 runs recovery only when asked (startup, admin RPC).
  std::chrono::milliseconds interval{0};
  // Skip ACTIVE records heartbeated within this window; peers may still own them.
  // Required when interval > 0.
  std::chrono::milliseconds min_idle{0};
  // 0 disables repair of records stuck in RESUMING.
  std::chrono::milliseconds stale_resuming_after{std::chrono::minutes(10)};
  // 0 disables the age cutoff.
  std::chrono::milliseconds max_recovery_age{std::chrono::hours(24)};

  int                       write_retry_attempts = 3;
  std::chrono::milliseconds write_retry_backoff{200};
};

struct RecoveryReport {
  std::size_t candidates   = 0;
  std::size_t claimed      = 0;
  std::size_t resumed      = 0;
  std::size_t failed       = 0;
  std::size_t claims_lost  = 0;
  std::size_t skipped      = 0;
  std::size_t store_errors = 0;
  // RESUMING records failed by RepairStaleResuming.
  std::size_t repaired = 0;

  RecoveryReport& operator+=(const RecoveryReport& other);
};

struct RecoveryStats {
  std::uint64_t  runs = 0;
  RecoveryReport totals;
};

/*
  Reconciles durable ACTIVE records that have no live owner.

  Claim protocol:
    1. CAS ACTIVE -> RESUMING. Exactly one claimer wins across all
       processes sharing the store; losers do nothing further.
    2. Winner resumes through the driver under a deadline.
    3. Winner settles with CAS RESUMING -> ACTIVE (then registers the
       handle) or RESUMING -> FAILED (then notifies the owner).

  A record whose settle write cannot reach the store stays RESUMING and
  is failed later by RepairStaleResuming.
*/
class RecoveryCoordinator {
 public:
  RecoveryCoordinator(std::shared_ptr<db::SessionStore> store, std::shared_ptr<driver::BrowserDriver> driver,
                      std::shared_ptr<core::SessionRegistry> registry, std::shared_ptr<events::EventSink> events,
                      std::shared_ptr<notify::OwnerNotifier> notifier, RecoveryOptions options);
  ~RecoveryCoordinator();

  RecoveryCoordinator(const RecoveryCoordinator&)            = delete;
  RecoveryCoordinator& operator=(const RecoveryCoordinator&) = delete;

  // Throws util::StoreUnavailable if candidates cannot be listed.
  RecoveryReport RunOnce();

  // Returns the number of records moved RESUMING -> FAILED.
  std::size_t RepairStaleResuming();

  void Start();
  void Stop();

  RecoveryStats Stats() const;

  const RecoveryOptions& Options() const {
    return options_;
  }

 private:
  void Loop();

  void Attempt(const db::model::SessionRecord& record, RecoveryReport& report, observability::SpanScope& span);

  // Settles a claimed record as FAILED; the caller holds the session lock.
  void FailClaimed(const db::model::SessionRecord& record, const std::string& reason, RecoveryReport& report);

  db::Result WriteWithRetry(const std::function<db::Result()>& write) const;

  void Accumulate(const RecoveryReport& report, bool completed_run);

  std::shared_ptr<db::SessionStore>      store_;
  std::shared_ptr<driver::BrowserDriver> driver_;
  std::shared_ptr<core::SessionRegistry> registry_;
  std::shared_ptr<events::EventSink>     events_;
  std::shared_ptr<notify::OwnerNotifier> notifier_;
  RecoveryOptions                        options_;

  // One reconciliation pass at a time per process.
  std::mutex run_mutex_;

  mutable std::mutex stats_mutex_;
  RecoveryStats      stats_;

  std::mutex              loop_mutex_;
  std::condition_variable loop_cv_;
  bool                    stop_requested_ = false;
  std::thread             thread_;
};

} // namespace sessionkeeper::recovery
