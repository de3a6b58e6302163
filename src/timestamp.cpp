#include <s2_proto/timestamp.hpp>

#include <limits>

namespace s2_proto
{

namespace
{
constexpr int64_t kMaxNanos = std::numeric_limits<int64_t>::max();
constexpr int64_t kMinNanos = std::numeric_limits<int64_t>::min();

// Truncated bounds, used by Duration (seconds and nanos share a sign).
constexpr int64_t kMaxSeconds = kMaxNanos / kNanosPerSecond;      // 9223372036
constexpr int64_t kMinSeconds = kMinNanos / kNanosPerSecond;      // -9223372036
constexpr int64_t kMaxSubsecAtMax = kMaxNanos % kNanosPerSecond;  // 854775807
constexpr int64_t kMinSubsecAtMin = kMinNanos % kNanosPerSecond;  // -854775808

// Floored bounds, used by Timestamp (nanos always in [0, 1e9)).
constexpr int64_t kMinFlooredSeconds = kMinSeconds - 1;                         // -9223372037
constexpr int64_t kMinSubsecAtFlooredMin = kMinSubsecAtMin + kNanosPerSecond;  // 145224192
}  // namespace

google::protobuf::Timestamp Converter<TimePoint, google::protobuf::Timestamp>::pack(TimePoint value)
{
    const int64_t ns = value.time_since_epoch().count();
    int64_t seconds = ns / kNanosPerSecond;
    int64_t nanos = ns % kNanosPerSecond;
    if (nanos < 0)
    {
        nanos += kNanosPerSecond;
        --seconds;
    }

    google::protobuf::Timestamp out;
    out.set_seconds(seconds);
    out.set_nanos(static_cast<int32_t>(nanos));
    return out;
}

TimePoint Converter<TimePoint, google::protobuf::Timestamp>::unpack(google::protobuf::Timestamp value)
{
    const int64_t seconds = value.seconds();
    const int32_t nanos = value.nanos();

    if (nanos < 0 || nanos >= kNanosPerSecond)
    {
        throw ConversionError::invalidTimestamp(seconds, nanos);
    }
    if (seconds > kMaxSeconds || seconds < kMinFlooredSeconds)
    {
        throw ConversionError::invalidTimestamp(seconds, nanos);
    }
    if ((seconds == kMaxSeconds && nanos > kMaxSubsecAtMax) || (seconds == kMinFlooredSeconds && nanos < kMinSubsecAtFlooredMin))
    {
        throw ConversionError::invalidTimestamp(seconds, nanos);
    }

    // seconds * 1e9 alone overflows at kMinFlooredSeconds; borrow one second first.
    const int64_t ns = seconds < 0 ? (seconds + 1) * kNanosPerSecond + (nanos - kNanosPerSecond) : seconds * kNanosPerSecond + nanos;
    return TimePoint(std::chrono::nanoseconds(ns));
}

google::protobuf::Duration Converter<std::chrono::nanoseconds, google::protobuf::Duration>::pack(std::chrono::nanoseconds value)
{
    const int64_t ns = value.count();

    google::protobuf::Duration out;
    out.set_seconds(ns / kNanosPerSecond);
    out.set_nanos(static_cast<int32_t>(ns % kNanosPerSecond));
    return out;
}

std::chrono::nanoseconds Converter<std::chrono::nanoseconds, google::protobuf::Duration>::unpack(google::protobuf::Duration value)
{
    const int64_t seconds = value.seconds();
    const int32_t nanos = value.nanos();

    if (nanos <= -kNanosPerSecond || nanos >= kNanosPerSecond)
    {
        throw ConversionError::invalidDuration(seconds, nanos);
    }
    if ((seconds > 0 && nanos < 0) || (seconds < 0 && nanos > 0))
    {
        throw ConversionError::invalidDuration(seconds, nanos);
    }
    if (seconds > kMaxSeconds || seconds < kMinSeconds)
    {
        throw ConversionError::invalidDuration(seconds, nanos);
    }
    if ((seconds == kMaxSeconds && nanos > kMaxSubsecAtMax) || (seconds == kMinSeconds && nanos < kMinSubsecAtMin))
    {
        throw ConversionError::invalidDuration(seconds, nanos);
    }

    return std::chrono::nanoseconds(seconds * kNanosPerSecond + nanos);
}

}  // namespace s2_proto
