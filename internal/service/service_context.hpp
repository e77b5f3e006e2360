#pragma once

#include <memory>

namespace sessionkeeper::core {
class SessionManager;
}
namespace sessionkeeper::recovery {
class RecoveryCoordinator;
}

namespace sessionkeeper::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<sessionkeeper::core::SessionManager>          manager;
  std::shared_ptr<sessionkeeper::recovery::RecoveryCoordinator> coordinator;
};

} // namespace sessionkeeper::service
