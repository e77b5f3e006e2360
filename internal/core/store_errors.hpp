#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace sessionkeeper::core {

inline void ThrowIfStoreError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  if (db::IsRetryable(result.code)) {
    throw util::StoreUnavailable(message);
  }
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
    case db::ErrorCode::ConstraintViolation:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace sessionkeeper::core
