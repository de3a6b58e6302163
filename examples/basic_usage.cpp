#include <chrono>
#include <iostream>
#include <optional>
#include <string>

#include <s2_proto/s2_proto.hpp>

struct Annotation
{
    std::string author;
    std::string text;
};

void to_json(nlohmann::json& j, const Annotation& a)
{
    j = nlohmann::json{ { "author", a.author }, { "text", a.text } };
}

void from_json(const nlohmann::json& j, Annotation& a)
{
    j.at("author").get_to(a.author);
    j.at("text").get_to(a.text);
}

int main()
{
    using google::protobuf::Any;
    using google::protobuf::Timestamp;

    // Timestamps
    const s2_proto::TimePoint now = std::chrono::time_point_cast<std::chrono::nanoseconds>(std::chrono::system_clock::now());
    Timestamp ts = s2_proto::pack<Timestamp>(now);
    std::cout << "now -> seconds=" << ts.seconds() << " nanos=" << ts.nanos() << "\n";

    // Untyped JSON in an Any
    Any any = s2_proto::pack<Any>(nlohmann::json{ { "a", 1 }, { "b", { true, nullptr } } });
    std::cout << "json -> type_url='" << any.type_url() << "' value=" << any.value() << "\n";

    // Arbitrary struct boxed in an Any
    Any boxed = s2_proto::pack<Any>(s2_proto::Json<Annotation>{ { "ops", "valve replaced" } });
    Annotation note = s2_proto::unpack<s2_proto::Json<Annotation>>(boxed).value;
    std::cout << "boxed -> " << note.author << ": " << note.text << "\n";

    // Required field, absent on the wire
    std::optional<Timestamp> missing;
    try
    {
        (void)s2_proto::unpack<s2_proto::TimePoint>(missing);
    }
    catch (const s2_proto::ConversionError& e)
    {
        std::cerr << "expected failure [" << s2_proto::toString(e.kind()) << "]: " << e.what() << "\n";
    }

    // Payload from somebody else's encoding
    any.set_type_url("other/format");
    try
    {
        (void)s2_proto::unpack<nlohmann::json>(any);
    }
    catch (const s2_proto::ConversionError& e)
    {
        std::cerr << "expected failure [" << s2_proto::toString(e.kind()) << "]: type_url='" << e.typeUrl() << "'\n";
    }

    return 0;
}
