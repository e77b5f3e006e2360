#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/model/state_machine.hpp"

namespace sessionkeeper::events {

enum class TransitionKind : std::uint8_t {
  kCreated,
  kHeartbeat,
  kResumeClaimed,
  kResumed,
  kResumeFailed,
  kAbandoned,
  kCompleted,
  kFailed,
};

constexpr std::string_view ToString(TransitionKind kind) {
  switch (kind) {
    case TransitionKind::kCreated:
      return "created";
    case TransitionKind::kHeartbeat:
      return "heartbeat";
    case TransitionKind::kResumeClaimed:
      return "resume-claimed";
    case TransitionKind::kResumed:
      return "resumed";
    case TransitionKind::kResumeFailed:
      return "resume-failed";
    case TransitionKind::kAbandoned:
      return "abandoned";
    case TransitionKind::kCompleted:
      return "completed";
    case TransitionKind::kFailed:
      return "failed";
  }
  return "unknown";
}

/*
  One event per state transition (heartbeats are Active -> Active).
  from is kUnspecified for creation.
*/
struct TransitionEvent {
  TransitionKind       kind;
  std::string          session_id;
  model::SessionStatus from = model::SessionStatus::kUnspecified;
  model::SessionStatus to   = model::SessionStatus::kUnspecified;
  std::uint64_t        timestamp_ms = 0;
  // Optional context such as a failure reason.
  std::string detail;
};

} // namespace sessionkeeper::events
