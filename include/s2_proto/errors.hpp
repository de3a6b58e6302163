#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace s2_proto
{

/**
 * @brief Thrown by every failing pack/unpack. kind() tells which check failed.
 */
class ConversionError : public std::runtime_error
{
  public:
    enum class Kind
    {
        JsonCodec,           // nlohmann encode/decode failure (malformed bytes, shape mismatch)
        JsonTypeUrlUnknown,  // Any carried a type url this side does not understand
        ValueNotPresent,     // required native field, absent wire optional
        InvalidTimestamp,    // nanos out of [0, 1e9) or instant not representable as TimePoint
        InvalidDuration,     // nanos out of range, mixed signs, or overflow
    };

    static ConversionError jsonCodec(const nlohmann::json::exception& e);
    // JsonCodec for a tree node JSON text cannot hold (NaN, Inf, binary); codecErrorId() is -1.
    static ConversionError jsonUnrepresentable(const std::string& detail);
    static ConversionError jsonTypeUrlUnknown(const std::string& type_url);
    static ConversionError valueNotPresent();
    static ConversionError invalidTimestamp(int64_t seconds, int32_t nanos);
    static ConversionError invalidDuration(int64_t seconds, int32_t nanos);

    Kind kind() const noexcept
    {
        return kind_;
    }

    // Offending url, only set for Kind::JsonTypeUrlUnknown.
    const std::string& typeUrl() const noexcept
    {
        return type_url_;
    }

    // nlohmann exception id (e.g. 101 parse error, 302 type error), -1 for other kinds.
    int codecErrorId() const noexcept
    {
        return codec_error_id_;
    }

  private:
    ConversionError(Kind kind, const std::string& what);

    Kind kind_;
    std::string type_url_;
    int codec_error_id_ = -1;
};

const char* toString(ConversionError::Kind kind);

}  // namespace s2_proto
