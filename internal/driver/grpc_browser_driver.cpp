#include "internal/driver/grpc_browser_driver.hpp"

#include <grpcpp/client_context.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sessionkeeper::driver {

namespace {

void SetDeadline(::grpc::ClientContext& ctx, std::chrono::milliseconds timeout) {
  ctx.set_deadline(std::chrono::system_clock::now() + timeout);
}

std::string Describe(const ::grpc::Status& status) {
  return std::to_string(static_cast<int>(status.error_code())) + " " + status.error_message();
}

DriverHandle FromProto(const sessionkeeper::v1::DriverHandle& handle) {
  return DriverHandle{handle.handle_id(), handle.view_url()};
}

} // namespace

GrpcBrowserDriver::GrpcBrowserDriver(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds release_timeout)
    : stub_(sessionkeeper::v1::BrowserDriverService::NewStub(std::move(channel))), release_timeout_(release_timeout) {
}

DriverHandle GrpcBrowserDriver::Spin(const std::string& target_url, std::chrono::milliseconds timeout) {
  sessionkeeper::v1::SpinRequest req;
  req.set_target_url(target_url);

  sessionkeeper::v1::SpinResponse resp;
  ::grpc::ClientContext           ctx;
  SetDeadline(ctx, timeout);

  const auto status = stub_->Spin(&ctx, req, &resp);
  if (!status.ok()) {
    throw util::DriverSpinFailure("driver spin failed: " + Describe(status));
  }
  if (resp.handle().handle_id().empty()) {
    throw util::DriverSpinFailure("driver spin returned an empty handle");
  }
  return FromProto(resp.handle());
}

DriverHandle GrpcBrowserDriver::Resume(const std::string& resume_token, std::chrono::milliseconds timeout) {
  sessionkeeper::v1::ResumeRequest req;
  req.set_resume_token(resume_token);

  sessionkeeper::v1::ResumeResponse resp;
  ::grpc::ClientContext             ctx;
  SetDeadline(ctx, timeout);

  const auto status = stub_->Resume(&ctx, req, &resp);
  if (!status.ok()) {
    throw util::ResumeFailure("driver resume failed: " + Describe(status));
  }
  if (resp.handle().handle_id().empty()) {
    throw util::ResumeFailure("driver resume returned an empty handle");
  }
  return FromProto(resp.handle());
}

void GrpcBrowserDriver::Release(const DriverHandle& handle) noexcept {
  if (!handle.Valid()) return;

  try {
    sessionkeeper::v1::ReleaseRequest req;
    req.mutable_handle()->set_handle_id(handle.handle_id);
    req.mutable_handle()->set_view_url(handle.view_url);

    google::protobuf::Empty resp;
    ::grpc::ClientContext   ctx;
    SetDeadline(ctx, release_timeout_);

    const auto status = stub_->Release(&ctx, req, &resp);
    if (!status.ok()) {
      SESSIONKEEPER_LOG_WARN("driver release failed", {observability::StringField("handle_id", handle.handle_id),
                                                       observability::StringField("error", status.error_message())});
    }
  } catch (const std::exception& e) {
    SESSIONKEEPER_LOG_WARN("driver release threw", {observability::StringField("handle_id", handle.handle_id),
                                                    observability::StringField("error", e.what())});
  }
}

} // namespace sessionkeeper::driver
