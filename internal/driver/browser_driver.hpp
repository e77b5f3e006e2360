#pragma once

#include <chrono>
#include <string>

namespace sessionkeeper::driver {

/*
  Live handle to a browser owned by the external automation backend.

  Never persisted. A handle must be released exactly once.
*/
struct DriverHandle {
  std::string handle_id;
  std::string view_url;

  bool Valid() const {
    return !handle_id.empty();
  }
};

/*
  Adapter for the external automation driver.

  Spin/Resume must return within the given timeout or throw:
    Spin   -> util::DriverSpinFailure
    Resume -> util::ResumeFailure
  Release is best-effort and never throws.
*/
class BrowserDriver {
 public:
  virtual ~BrowserDriver() = default;

  virtual DriverHandle Spin(const std::string& target_url, std::chrono::milliseconds timeout) = 0;

  virtual DriverHandle Resume(const std::string& resume_token, std::chrono::milliseconds timeout) = 0;

  virtual void Release(const DriverHandle& handle) noexcept = 0;
};

} // namespace sessionkeeper::driver
