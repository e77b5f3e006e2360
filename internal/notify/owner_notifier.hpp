#pragma once

#include <string>

namespace sessionkeeper::notify {

/*
  Tells a session owner that their job could not be recovered.
  Delivery is best-effort: implementations must not throw.
*/
class OwnerNotifier {
 public:
  virtual ~OwnerNotifier() = default;

  virtual void NotifyRecoveryFailed(const std::string& owner, const std::string& session_id,
                                    const std::string& reason) noexcept = 0;
};

} // namespace sessionkeeper::notify
