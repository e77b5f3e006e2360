#pragma once

#include "internal/notify/owner_notifier.hpp"

namespace sessionkeeper::notify {

class LoggingOwnerNotifier final : public OwnerNotifier {
 public:
  void NotifyRecoveryFailed(const std::string& owner, const std::string& session_id, const std::string& reason) noexcept override;
};

} // namespace sessionkeeper::notify
