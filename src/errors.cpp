#include <s2_proto/errors.hpp>

namespace s2_proto
{

ConversionError::ConversionError(Kind kind, const std::string& what) : std::runtime_error(what), kind_(kind)
{
}

ConversionError ConversionError::jsonCodec(const nlohmann::json::exception& e)
{
    ConversionError err(Kind::JsonCodec, std::string("json codec: ") + e.what());
    err.codec_error_id_ = e.id;
    return err;
}

ConversionError ConversionError::jsonUnrepresentable(const std::string& detail)
{
    return ConversionError(Kind::JsonCodec, "json codec: " + detail);
}

ConversionError ConversionError::jsonTypeUrlUnknown(const std::string& type_url)
{
    ConversionError err(Kind::JsonTypeUrlUnknown, "unknown Any type url '" + type_url + "'");
    err.type_url_ = type_url;
    return err;
}

ConversionError ConversionError::valueNotPresent()
{
    return ConversionError(Kind::ValueNotPresent, "required value not present");
}

ConversionError ConversionError::invalidTimestamp(int64_t seconds, int32_t nanos)
{
    return ConversionError(Kind::InvalidTimestamp, "invalid timestamp: seconds=" + std::to_string(seconds) + " nanos=" + std::to_string(nanos));
}

ConversionError ConversionError::invalidDuration(int64_t seconds, int32_t nanos)
{
    return ConversionError(Kind::InvalidDuration, "invalid duration: seconds=" + std::to_string(seconds) + " nanos=" + std::to_string(nanos));
}

const char* toString(ConversionError::Kind kind)
{
    switch (kind)
    {
        case ConversionError::Kind::JsonCodec:
            return "JsonCodec";
        case ConversionError::Kind::JsonTypeUrlUnknown:
            return "JsonTypeUrlUnknown";
        case ConversionError::Kind::ValueNotPresent:
            return "ValueNotPresent";
        case ConversionError::Kind::InvalidTimestamp:
            return "InvalidTimestamp";
        case ConversionError::Kind::InvalidDuration:
            return "InvalidDuration";
    }
    return "?";
}

}  // namespace s2_proto
