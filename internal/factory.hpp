#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/config/runtime_options.hpp"

namespace sessionkeeper::db {
class SessionStore;
}
namespace sessionkeeper::driver {
class BrowserDriver;
}
namespace sessionkeeper::core {
class SessionRegistry;
class SessionManager;
} // namespace sessionkeeper::core
namespace sessionkeeper::heartbeat {
class HeartbeatMonitor;
}
namespace sessionkeeper::recovery {
class RecoveryCoordinator;
}

namespace sessionkeeper::factory {

/*
  Application

  Owns all long-lived components used by the daemon.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  config::RuntimeOptions options;

  std::shared_ptr<db::SessionStore>                store;
  std::shared_ptr<driver::BrowserDriver>           driver;
  std::shared_ptr<core::SessionRegistry>           registry;
  std::shared_ptr<core::SessionManager>            manager;
  std::shared_ptr<heartbeat::HeartbeatMonitor>     monitor;
  std::shared_ptr<recovery::RecoveryCoordinator>   coordinator;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Composition root. The ONLY place allowed to know concrete store and
  driver types.
*/
Application Build(const sessionkeeper::runtime::config::RuntimeConfig& config);

// Exposed so tools and tests can open a store without building the daemon.
std::shared_ptr<db::SessionStore> BuildStore(const sessionkeeper::runtime::config::DatabaseConfig& database);

} // namespace sessionkeeper::factory
