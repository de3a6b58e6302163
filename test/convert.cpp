#include <s2_proto/convert.hpp>
#include <s2_proto/json.hpp>
#include <s2_proto/scalars.hpp>
#include <s2_proto/timestamp.hpp>

#include <gtest/gtest.h>

#include <optional>
#include <string>

using s2_proto::ConversionError;
using s2_proto::HasConverter;

// A native type with a hand-written base conversion, to check that lifting
// applies to user pairings exactly as to the built-in ones.
struct Celsius
{
    double degrees = 0.0;
};

namespace s2_proto
{
template <>
struct Converter<Celsius, google::protobuf::DoubleValue>
{
    static google::protobuf::DoubleValue pack(Celsius value)
    {
        google::protobuf::DoubleValue out;
        out.set_value(value.degrees);
        return out;
    }

    static Celsius unpack(google::protobuf::DoubleValue value)
    {
        return Celsius{ value.value() };
    }
};
}  // namespace s2_proto

TEST(ConverterTraits, DetectsDefinedPairings)
{
    EXPECT_TRUE((HasConverter<double, double>::value));
    EXPECT_TRUE((HasConverter<std::optional<double>, std::optional<double>>::value));
    EXPECT_TRUE((HasConverter<double, std::optional<double>>::value));
    EXPECT_TRUE((HasConverter<s2_proto::TimePoint, std::optional<google::protobuf::Timestamp>>::value));
    EXPECT_TRUE((HasConverter<std::optional<s2_proto::Json<int>>, std::optional<google::protobuf::Any>>::value));
    EXPECT_TRUE((HasConverter<Celsius, std::optional<google::protobuf::DoubleValue>>::value));
}

TEST(ConverterTraits, RejectsUndefinedPairings)
{
    EXPECT_FALSE((HasConverter<double, float>::value));
    EXPECT_FALSE((HasConverter<std::string, google::protobuf::Any>::value));
    EXPECT_FALSE((HasConverter<std::optional<double>, double>::value));
    EXPECT_FALSE((HasConverter<Celsius, double>::value));
}

TEST(OptionalLifting, OptionalToOptionalKeepsAbsence)
{
    std::optional<Celsius> none;
    EXPECT_FALSE(s2_proto::pack<std::optional<google::protobuf::DoubleValue>>(none).has_value());

    std::optional<google::protobuf::DoubleValue> wire_none;
    EXPECT_FALSE((s2_proto::unpack<std::optional<Celsius>>(wire_none).has_value()));
}

TEST(OptionalLifting, OptionalToOptionalDelegatesToBase)
{
    std::optional<Celsius> some = Celsius{ 21.5 };
    auto wire = s2_proto::pack<std::optional<google::protobuf::DoubleValue>>(some);
    ASSERT_TRUE(wire.has_value());

    auto base = s2_proto::pack<google::protobuf::DoubleValue>(Celsius{ 21.5 });
    EXPECT_EQ(wire->value(), base.value());

    auto back = s2_proto::unpack<std::optional<Celsius>>(wire);
    ASSERT_TRUE(back.has_value());
    EXPECT_DOUBLE_EQ(back->degrees, 21.5);
}

TEST(OptionalLifting, RequiredPackAlwaysEngages)
{
    auto wire = s2_proto::pack<std::optional<google::protobuf::DoubleValue>>(Celsius{ -4.0 });
    ASSERT_TRUE(wire.has_value());
    EXPECT_DOUBLE_EQ(wire->value(), -4.0);
}

TEST(OptionalLifting, RequiredUnpackOfAbsentIsValueNotPresent)
{
    std::optional<google::protobuf::DoubleValue> absent;
    try
    {
        (void)s2_proto::unpack<Celsius>(absent);
        FAIL() << "expected ConversionError";
    }
    catch (const ConversionError& e)
    {
        EXPECT_EQ(e.kind(), ConversionError::Kind::ValueNotPresent);
        EXPECT_STREQ(s2_proto::toString(e.kind()), "ValueNotPresent");
    }
}

TEST(OptionalLifting, RequiredUnpackOfPresentMatchesBase)
{
    google::protobuf::DoubleValue w;
    w.set_value(37.0);

    auto via_optional = s2_proto::unpack<Celsius>(std::optional<google::protobuf::DoubleValue>(w));
    auto via_base = s2_proto::unpack<Celsius>(w);
    EXPECT_DOUBLE_EQ(via_optional.degrees, via_base.degrees);
}

TEST(OptionalLifting, RequiredUnpackPropagatesBaseErrors)
{
    google::protobuf::Timestamp bad;
    bad.set_seconds(10);
    bad.set_nanos(-1);

    try
    {
        (void)s2_proto::unpack<s2_proto::TimePoint>(std::optional<google::protobuf::Timestamp>(bad));
        FAIL() << "expected ConversionError";
    }
    catch (const ConversionError& e)
    {
        EXPECT_EQ(e.kind(), ConversionError::Kind::InvalidTimestamp);
    }
}

TEST(OptionalField, ReflectsPresence)
{
    google::protobuf::Timestamp ts;
    ts.set_seconds(5);

    EXPECT_FALSE(s2_proto::optionalField(false, ts).has_value());
    auto present = s2_proto::optionalField(true, ts);
    ASSERT_TRUE(present.has_value());
    EXPECT_EQ(present->seconds(), 5);
}
