#include <s2_proto/json.hpp>

#include <cmath>
#include <unordered_map>

namespace s2_proto
{

namespace
{
// dump() writes NaN/Inf as null and binary as an object; refuse those instead.
void checkRepresentable(const nlohmann::json& node, const std::string& path)
{
    switch (node.type())
    {
        case nlohmann::json::value_t::number_float:
            if (!std::isfinite(node.get<double>()))
            {
                throw ConversionError::jsonUnrepresentable("non-finite number at '" + path + "'");
            }
            break;
        case nlohmann::json::value_t::binary:
            throw ConversionError::jsonUnrepresentable("binary value at '" + path + "'");
        case nlohmann::json::value_t::array:
            for (size_t i = 0; i < node.size(); ++i)
            {
                checkRepresentable(node[i], path + "/" + std::to_string(i));
            }
            break;
        case nlohmann::json::value_t::object:
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                checkRepresentable(it.value(), path + "/" + it.key());
            }
            break;
        default:
            break;
    }
}
}  // namespace

std::optional<AnyFormat> anyFormatForTypeUrl(const std::string& type_url)
{
    static const std::unordered_map<std::string, AnyFormat> known = {
        { kJsonTypeUrl, AnyFormat::Json },
    };

    auto it = known.find(type_url);
    if (it == known.end())
    {
        return std::nullopt;
    }
    return it->second;
}

google::protobuf::Any Converter<nlohmann::json, google::protobuf::Any>::pack(nlohmann::json value)
{
    checkRepresentable(value, "");

    google::protobuf::Any out;
    out.set_type_url(kJsonTypeUrl);
    try
    {
        out.set_value(value.dump());
    }
    catch (const nlohmann::json::exception& e)
    {
        throw ConversionError::jsonCodec(e);
    }
    return out;
}

nlohmann::json Converter<nlohmann::json, google::protobuf::Any>::unpack(google::protobuf::Any value)
{
    const auto format = anyFormatForTypeUrl(value.type_url());
    if (!format.has_value())
    {
        throw ConversionError::jsonTypeUrlUnknown(value.type_url());
    }

    switch (*format)
    {
        case AnyFormat::Json:
            try
            {
                return nlohmann::json::parse(value.value());
            }
            catch (const nlohmann::json::exception& e)
            {
                throw ConversionError::jsonCodec(e);
            }
    }
    throw ConversionError::jsonTypeUrlUnknown(value.type_url());
}

}  // namespace s2_proto
