#pragma once

#include "internal/events/event_sink.hpp"

namespace sessionkeeper::events {

/*
  Default sink: one structured log line plus a transition counter bump.
  Heartbeats log at debug level.
*/
class LoggingEventSink final : public EventSink {
 public:
  void Emit(const TransitionEvent& event) noexcept override;
};

} // namespace sessionkeeper::events
