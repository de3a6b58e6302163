#pragma once

#include <s2_proto/convert.hpp>

#include <google/protobuf/any.pb.h>
#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <utility>

namespace s2_proto
{

// Type url of an Any whose value holds UTF-8 JSON text. Not an http(s) url,
// so protobuf leaves its meaning to the implementation.
inline constexpr char kJsonTypeUrl[] = "s2/json";

// Payload encodings this side can decode. Anything else is rejected.
enum class AnyFormat
{
    Json,
};

std::optional<AnyFormat> anyFormatForTypeUrl(const std::string& type_url);

/**
 * @brief nlohmann::json <-> google.protobuf.Any{type_url: "s2/json", value: <json text>}.
 *
 * pack throws JsonCodec if the tree cannot be dumped (invalid UTF-8 in a string) or
 * holds a node JSON text cannot represent (NaN, Inf, binary) instead of
 * writing a substitute for it.
 * unpack throws JsonTypeUrlUnknown for any other type url, regardless of the
 * payload, and JsonCodec if the payload is not valid JSON text.
 */
template <>
struct Converter<nlohmann::json, google::protobuf::Any>
{
    static google::protobuf::Any pack(nlohmann::json value);
    static nlohmann::json unpack(google::protobuf::Any value);
};

/**
 * @brief Boxes any T with nlohmann to_json/from_json so it can travel in an Any.
 *
 * Encoded twice: T -> json tree -> JSON text in the Any.
 */
template <typename T>
struct Json
{
    T value;
};

template <typename T>
google::protobuf::Any packAny(const T& value)
{
    nlohmann::json tree;
    try
    {
        tree = value;
    }
    catch (const nlohmann::json::exception& e)
    {
        throw ConversionError::jsonCodec(e);
    }
    return Converter<nlohmann::json, google::protobuf::Any>::pack(std::move(tree));
}

template <typename T>
T unpackAny(google::protobuf::Any value)
{
    const nlohmann::json tree = Converter<nlohmann::json, google::protobuf::Any>::unpack(std::move(value));
    try
    {
        return tree.get<T>();
    }
    catch (const nlohmann::json::exception& e)
    {
        throw ConversionError::jsonCodec(e);
    }
}

template <typename T>
struct Converter<Json<T>, google::protobuf::Any>
{
    static google::protobuf::Any pack(Json<T> value)
    {
        return packAny(value.value);
    }

    static Json<T> unpack(google::protobuf::Any value)
    {
        return Json<T>{ unpackAny<T>(std::move(value)) };
    }
};

}  // namespace s2_proto
