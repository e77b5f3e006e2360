#pragma once

#include <stdexcept>
#include <string>

namespace sessionkeeper::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Durable store unreachable or busy. Retryable; never implies a transition.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DriverSpinFailure : public std::runtime_error {
 public:
  explicit DriverSpinFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResumeFailure : public std::runtime_error {
 public:
  explicit ResumeFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace sessionkeeper::util
