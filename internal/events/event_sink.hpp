#pragma once

#include "internal/events/transition_event.hpp"

namespace sessionkeeper::events {

class EventSink {
 public:
  virtual ~EventSink() = default;

  // Must not throw; called with the per-session lock held.
  virtual void Emit(const TransitionEvent& event) noexcept = 0;
};

} // namespace sessionkeeper::events
