#pragma once

#include <s2_proto/convert.hpp>

#include <google/protobuf/duration.pb.h>
#include <google/protobuf/timestamp.pb.h>

#include <chrono>
#include <cstdint>

namespace s2_proto
{

// UTC instant (Unix epoch) with nanosecond resolution. Covers roughly 1677-09-21 .. 2262-04-11.
using TimePoint = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

constexpr int64_t kNanosPerSecond = 1'000'000'000;

/**
 * @brief TimePoint <-> google.protobuf.Timestamp.
 *
 * pack splits the instant into floor(seconds) and nanos in [0, 1e9), so instants
 * before the epoch have negative seconds and positive nanos.
 * unpack rejects nanos outside [0, 1e9) and instants TimePoint cannot hold
 * (InvalidTimestamp). Nothing is clamped.
 */
template <>
struct Converter<TimePoint, google::protobuf::Timestamp>
{
    static google::protobuf::Timestamp pack(TimePoint value);
    static TimePoint unpack(google::protobuf::Timestamp value);
};

/**
 * @brief std::chrono::nanoseconds <-> google.protobuf.Duration.
 *
 * seconds and nanos carry the same sign and |nanos| < 1e9. Violations and
 * durations past +-292 years throw InvalidDuration.
 */
template <>
struct Converter<std::chrono::nanoseconds, google::protobuf::Duration>
{
    static google::protobuf::Duration pack(std::chrono::nanoseconds value);
    static std::chrono::nanoseconds unpack(google::protobuf::Duration value);
};

}  // namespace s2_proto
