#pragma once

#include <chrono>
#include <string>

#include "config/config.pb.h"
#include "internal/core/session_manager.hpp"
#include "internal/heartbeat/heartbeat_monitor.hpp"
#include "internal/recovery/recovery_coordinator.hpp"

namespace sessionkeeper::config {

struct DriverOptions {
  std::string               endpoint;
  std::chrono::milliseconds release_timeout{5000};
};

/*
  RuntimeConfig with defaults applied, in the shapes the engine consumes.

  Defaults:
    server.bind_address             0.0.0.0:50061
    sessions.max_sessions           0 (unlimited)
    sessions.spin_attempts          3
    sessions.spin_backoff           2s
    driver.spin_timeout             30s
    driver.release_timeout          5s
    heartbeat.timeout               60s
    heartbeat.sweep_interval        10s
    recovery.parallelism            4
    recovery.resume_timeout         60s
    recovery.stale_resuming_after   10m
    recovery.max_recovery_age       24h
*/
struct RuntimeOptions {
  std::string                 bind_address;
  core::SessionManagerOptions sessions;
  heartbeat::HeartbeatOptions heartbeat;
  recovery::RecoveryOptions   recovery;
  DriverOptions               driver;
};

// Throws util::InvalidArgument for combinations the engine cannot run with.
RuntimeOptions ResolveOptions(const sessionkeeper::runtime::config::RuntimeConfig& config);

} // namespace sessionkeeper::config
