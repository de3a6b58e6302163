#pragma once

#include <s2_proto/convert.hpp>

#include <google/protobuf/wrappers.pb.h>

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>

namespace s2_proto
{

template <typename T>
struct IsScalarWire
  : std::disjunction<std::is_same<T, float>, std::is_same<T, double>, std::is_same<T, int32_t>, std::is_same<T, int64_t>, std::is_same<T, uint32_t>,
                     std::is_same<T, uint64_t>, std::is_same<T, bool>, std::is_same<T, std::string>>
{
};

// Scalars travel as themselves. Their optional forms come from the lifting in convert.hpp.
template <typename T>
struct Converter<T, T, std::enable_if_t<IsScalarWire<T>::value>>
{
    static T pack(T value)
    {
        return value;
    }

    static T unpack(T value)
    {
        return value;
    }
};

// google.protobuf.*Value wrappers: a one-field message around a scalar.
template <typename Native, typename WrapperMsg>
struct WrapperConverter
{
    static WrapperMsg pack(Native value)
    {
        WrapperMsg out;
        out.set_value(std::move(value));
        return out;
    }

    static Native unpack(WrapperMsg value)
    {
        if constexpr (std::is_same_v<Native, std::string>)
        {
            return std::move(*value.mutable_value());
        }
        else
        {
            return value.value();
        }
    }
};

template <>
struct Converter<double, google::protobuf::DoubleValue> : WrapperConverter<double, google::protobuf::DoubleValue>
{
};

template <>
struct Converter<float, google::protobuf::FloatValue> : WrapperConverter<float, google::protobuf::FloatValue>
{
};

template <>
struct Converter<int64_t, google::protobuf::Int64Value> : WrapperConverter<int64_t, google::protobuf::Int64Value>
{
};

template <>
struct Converter<uint64_t, google::protobuf::UInt64Value> : WrapperConverter<uint64_t, google::protobuf::UInt64Value>
{
};

template <>
struct Converter<int32_t, google::protobuf::Int32Value> : WrapperConverter<int32_t, google::protobuf::Int32Value>
{
};

template <>
struct Converter<uint32_t, google::protobuf::UInt32Value> : WrapperConverter<uint32_t, google::protobuf::UInt32Value>
{
};

template <>
struct Converter<bool, google::protobuf::BoolValue> : WrapperConverter<bool, google::protobuf::BoolValue>
{
};

template <>
struct Converter<std::string, google::protobuf::StringValue> : WrapperConverter<std::string, google::protobuf::StringValue>
{
};

}  // namespace s2_proto
