#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "google/protobuf/timestamp.pb.h"

namespace fleet::util {

/*
  Time utilities, the single place that controls the clock source.

  Persistent timestamps are unix milliseconds. Components that compare
  against stored timestamps take a MillisClock so tests can drive time.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

using MillisClock = std::function<std::int64_t()>;

TimePoint Now();

std::int64_t NowMillis();

// Clock reading Clock::now().
MillisClock SystemMillisClock();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

std::int64_t ToUnixMillis(TimePoint tp);

constexpr std::int64_t SecondsToMillis(std::int64_t seconds) {
  return seconds * 1000;
}

} // namespace fleet::util
