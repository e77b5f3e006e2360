#include "internal/notify/logging_owner_notifier.hpp"

#include "internal/observability/logging.hpp"

namespace sessionkeeper::notify {

void LoggingOwnerNotifier::NotifyRecoveryFailed(const std::string& owner, const std::string& session_id,
                                                const std::string& reason) noexcept {
  SESSIONKEEPER_LOG_WARN("session could not be recovered", {observability::StringField("owner", owner),
                                                            observability::StringField("session_id", session_id),
                                                            observability::StringField("reason", reason)});
}

} // namespace sessionkeeper::notify
