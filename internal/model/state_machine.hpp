#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace sessionkeeper::model {

enum class SessionStatus : std::uint8_t {
  kUnspecified = 0,
  kActive      = 1,
  kResuming    = 2,
  kCompleted   = 3,
  kFailed      = 4,
  kAbandoned   = 5,
};

constexpr bool IsTerminal(SessionStatus status) {
  return status == SessionStatus::kCompleted || status == SessionStatus::kFailed || status == SessionStatus::kAbandoned;
}

/*
  Allowed status transitions.

    Active   -> Completed | Failed | Abandoned | Resuming
    Resuming -> Active | Failed

  Creation (none -> Active) is not a transition; it is Create().
  Active -> Active (heartbeat) only touches last_active_at and is not
  expressed as a status change either.
*/
constexpr bool CanTransition(SessionStatus from, SessionStatus to) {
  switch (from) {
    case SessionStatus::kActive:
      return to == SessionStatus::kCompleted || to == SessionStatus::kFailed || to == SessionStatus::kAbandoned ||
             to == SessionStatus::kResuming;
    case SessionStatus::kResuming:
      return to == SessionStatus::kActive || to == SessionStatus::kFailed;
    default:
      return false;
  }
}

constexpr std::string_view ToString(SessionStatus status) {
  switch (status) {
    case SessionStatus::kActive:
      return "active";
    case SessionStatus::kResuming:
      return "resuming";
    case SessionStatus::kCompleted:
      return "completed";
    case SessionStatus::kFailed:
      return "failed";
    case SessionStatus::kAbandoned:
      return "abandoned";
    default:
      return "unspecified";
  }
}

constexpr std::optional<SessionStatus> ParseStatus(std::string_view value) {
  if (value == "active") return SessionStatus::kActive;
  if (value == "resuming") return SessionStatus::kResuming;
  if (value == "completed") return SessionStatus::kCompleted;
  if (value == "failed") return SessionStatus::kFailed;
  if (value == "abandoned") return SessionStatus::kAbandoned;
  return std::nullopt;
}

} // namespace sessionkeeper::model
