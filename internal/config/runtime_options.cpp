#include "internal/config/runtime_options.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace sessionkeeper::config {

namespace {

using std::chrono::milliseconds;

milliseconds Or(const google::protobuf::Duration& value, bool present, milliseconds fallback) {
  if (!present) return fallback;
  return util::FromProto(value);
}

} // namespace

RuntimeOptions ResolveOptions(const sessionkeeper::runtime::config::RuntimeConfig& config) {
  RuntimeOptions options;

  options.bind_address = config.server().bind_address().empty() ? "0.0.0.0:50061" : config.server().bind_address();

  const auto& sessions           = config.sessions();
  options.sessions.max_sessions  = sessions.max_sessions();
  options.sessions.spin_attempts = sessions.spin_attempts() > 0 ? static_cast<int>(sessions.spin_attempts()) : 3;
  options.sessions.spin_backoff  = Or(sessions.spin_backoff(), sessions.has_spin_backoff(), std::chrono::seconds(2));
  options.sessions.spin_timeout  = Or(config.driver().spin_timeout(), config.driver().has_spin_timeout(), std::chrono::seconds(30));

  const auto& heartbeat             = config.heartbeat();
  options.heartbeat.timeout         = Or(heartbeat.timeout(), heartbeat.has_timeout(), std::chrono::seconds(60));
  options.heartbeat.sweep_interval  = Or(heartbeat.sweep_interval(), heartbeat.has_sweep_interval(), std::chrono::seconds(10));
  options.heartbeat.max_session_age = Or(heartbeat.max_session_age(), heartbeat.has_max_session_age(), milliseconds(0));

  const auto& recovery                  = config.recovery();
  options.recovery.parallelism          = recovery.parallelism() > 0 ? recovery.parallelism() : 4;
  options.recovery.resume_timeout       = Or(recovery.resume_timeout(), recovery.has_resume_timeout(), std::chrono::seconds(60));
  options.recovery.interval             = Or(recovery.interval(), recovery.has_interval(), milliseconds(0));
  options.recovery.min_idle             = Or(recovery.min_idle(), recovery.has_min_idle(), milliseconds(0));
  options.recovery.stale_resuming_after = Or(recovery.stale_resuming_after(), recovery.has_stale_resuming_after(), std::chrono::minutes(10));
  options.recovery.max_recovery_age     = Or(recovery.max_recovery_age(), recovery.has_max_recovery_age(), std::chrono::hours(24));

  // Peers may share the store: a record heartbeated within heartbeat.timeout can be live elsewhere.
  const bool shared_store = config.database().has_postgres() || options.recovery.interval.count() > 0;
  if (shared_store && !recovery.has_min_idle()) {
    options.recovery.min_idle = options.heartbeat.timeout + options.heartbeat.sweep_interval;
  }

  options.driver.endpoint        = config.driver().endpoint();
  options.driver.release_timeout = Or(config.driver().release_timeout(), config.driver().has_release_timeout(), std::chrono::seconds(5));

  if (options.driver.endpoint.empty()) {
    throw util::InvalidArgument("config: driver.endpoint is required");
  }
  if (options.heartbeat.timeout.count() <= 0) {
    throw util::InvalidArgument("config: heartbeat.timeout must be positive");
  }
  if (options.heartbeat.sweep_interval.count() <= 0 || options.heartbeat.sweep_interval >= options.heartbeat.timeout) {
    throw util::InvalidArgument("config: heartbeat.sweep_interval must be positive and shorter than heartbeat.timeout");
  }
  if (options.recovery.resume_timeout.count() <= 0) {
    throw util::InvalidArgument("config: recovery.resume_timeout must be positive");
  }
  if (options.recovery.stale_resuming_after.count() > 0 && options.recovery.stale_resuming_after <= options.recovery.resume_timeout) {
    throw util::InvalidArgument("config: recovery.stale_resuming_after must exceed recovery.resume_timeout");
  }
  if (shared_store && options.recovery.min_idle <= options.heartbeat.timeout) {
    throw util::InvalidArgument("config: recovery.min_idle must exceed heartbeat.timeout when recovery is periodic or the store is shared");
  }
  if (options.sessions.spin_timeout.count() <= 0) {
    throw util::InvalidArgument("config: driver.spin_timeout must be positive");
  }

  return options;
}

} // namespace sessionkeeper::config
