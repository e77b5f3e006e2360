#pragma once

#include <grpcpp/channel.h>

#include <memory>

#include "internal/driver/browser_driver.hpp"
#include "sessionkeeper/v1/driver_service.grpc.pb.h"

namespace sessionkeeper::driver {

/*
  BrowserDriver backed by a remote BrowserDriverService.

  Every call sets a gRPC deadline, so a stuck backend surfaces as
  DEADLINE_EXCEEDED instead of blocking the caller.
*/
class GrpcBrowserDriver final : public BrowserDriver {
 public:
  GrpcBrowserDriver(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds release_timeout);

  DriverHandle Spin(const std::string& target_url, std::chrono::milliseconds timeout) override;

  DriverHandle Resume(const std::string& resume_token, std::chrono::milliseconds timeout) override;

  void Release(const DriverHandle& handle) noexcept override;

 private:
  std::unique_ptr<sessionkeeper::v1::BrowserDriverService::StubInterface> stub_;
  std::chrono::milliseconds                                               release_timeout_;
};

} // namespace sessionkeeper::driver
