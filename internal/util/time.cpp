#include "time.hpp"

namespace sessionkeeper::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t NowMillis() {
  return ToUnixMillis(Now());
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

google::protobuf::Timestamp MillisToProto(uint64_t unix_ms) {
  google::protobuf::Timestamp ts;
  ts.set_seconds(static_cast<int64_t>(unix_ms / 1000));
  ts.set_nanos(static_cast<int32_t>((unix_ms % 1000) * 1000000));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d) {
  const auto total = std::chrono::seconds(d.seconds()) + std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::nanoseconds(d.nanos()));
  if (total.count() <= 0) {
    return std::chrono::milliseconds::zero();
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(total);
}

} // namespace sessionkeeper::util
