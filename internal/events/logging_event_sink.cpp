#include "internal/events/logging_event_sink.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace sessionkeeper::events {

void LoggingEventSink::Emit(const TransitionEvent& event) noexcept {
  const auto kind = ToString(event.kind);
  observability::Metrics::Instance().RecordTransition(kind);

  const auto level = event.kind == TransitionKind::kHeartbeat ? spdlog::level::debug : spdlog::level::info;
  if (event.detail.empty()) {
    observability::Log(level, "session transition",
                       {observability::StringField("event", kind), observability::StringField("session_id", event.session_id),
                        observability::StringField("from", model::ToString(event.from)),
                        observability::StringField("to", model::ToString(event.to)),
                        observability::IntField("timestamp_ms", static_cast<std::int64_t>(event.timestamp_ms))});
    return;
  }
  observability::Log(level, "session transition",
                     {observability::StringField("event", kind), observability::StringField("session_id", event.session_id),
                      observability::StringField("from", model::ToString(event.from)),
                      observability::StringField("to", model::ToString(event.to)),
                      observability::IntField("timestamp_ms", static_cast<std::int64_t>(event.timestamp_ms)),
                      observability::StringField("detail", event.detail)});
}

} // namespace sessionkeeper::events
