#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace sessionkeeper::util {

/*
  Time utilities: single place to control the clock source.

  Durable timestamps are unix milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();
uint64_t  NowMillis();

google::protobuf::Timestamp ToProto(TimePoint tp);
google::protobuf::Timestamp MillisToProto(uint64_t unix_ms);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

// Unset or negative durations map to zero.
std::chrono::milliseconds FromProto(const google::protobuf::Duration& d);

} // namespace sessionkeeper::util
