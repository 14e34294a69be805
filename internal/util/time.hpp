#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include <google/protobuf/timestamp.pb.h>

namespace alo::util {

/*
  Time utilities: single place to control clock source.

  Components that make time-based decisions take a NowFn so tests can
  drive the clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using NowFn     = std::function<TimePoint()>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

google::protobuf::Timestamp MillisToProto(uint64_t ms);
uint64_t                    ProtoToMillis(const google::protobuf::Timestamp& ts);

constexpr uint64_t kMillisPerDay = 24ULL * 60 * 60 * 1000;

} // namespace alo::util
