#include <s2_proto/scalars.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>

using s2_proto::ConversionError;

template <typename T>
class ScalarIdentity : public ::testing::Test
{
};

using ScalarTypes = ::testing::Types<float, double, int32_t, int64_t, uint32_t, uint64_t, bool, std::string>;
TYPED_TEST_SUITE(ScalarIdentity, ScalarTypes);

template <typename T>
static T sample()
{
    if constexpr (std::is_same_v<T, std::string>)
    {
        return "hello, \xc3\xa9t\xc3\xa9";
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
        return true;
    }
    else
    {
        return std::numeric_limits<T>::max();
    }
}

TYPED_TEST(ScalarIdentity, RoundTrip)
{
    const TypeParam v = sample<TypeParam>();
    EXPECT_EQ(s2_proto::unpack<TypeParam>(s2_proto::pack<TypeParam>(v)), v);
}

TYPED_TEST(ScalarIdentity, OptionalRoundTrip)
{
    std::optional<TypeParam> none;
    EXPECT_FALSE((s2_proto::unpack<std::optional<TypeParam>>(s2_proto::pack<std::optional<TypeParam>>(none))).has_value());

    std::optional<TypeParam> some = sample<TypeParam>();
    EXPECT_EQ((s2_proto::unpack<std::optional<TypeParam>>(s2_proto::pack<std::optional<TypeParam>>(some))), some);
}

TYPED_TEST(ScalarIdentity, RequiredFromAbsentOptionalFails)
{
    std::optional<TypeParam> absent;
    EXPECT_THROW((void)s2_proto::unpack<TypeParam>(absent), ConversionError);
}

TEST(ScalarEdges, ExtremesSurvive)
{
    EXPECT_EQ(s2_proto::pack<int64_t>(std::numeric_limits<int64_t>::min()), std::numeric_limits<int64_t>::min());
    EXPECT_EQ(s2_proto::pack<uint64_t>(std::numeric_limits<uint64_t>::max()), std::numeric_limits<uint64_t>::max());
    EXPECT_EQ(s2_proto::unpack<int32_t>(int32_t{ -7 }), -7);
    EXPECT_EQ(s2_proto::pack<std::string>(std::string()), "");
}

TEST(Wrappers, PackSetsValue)
{
    auto d = s2_proto::pack<google::protobuf::DoubleValue>(2.5);
    EXPECT_DOUBLE_EQ(d.value(), 2.5);

    auto u = s2_proto::pack<google::protobuf::UInt64Value>(std::numeric_limits<uint64_t>::max());
    EXPECT_EQ(u.value(), std::numeric_limits<uint64_t>::max());

    auto b = s2_proto::pack<google::protobuf::BoolValue>(true);
    EXPECT_TRUE(b.value());

    auto s = s2_proto::pack<google::protobuf::StringValue>(std::string("abc"));
    EXPECT_EQ(s.value(), "abc");
}

TEST(Wrappers, UnpackReadsValue)
{
    google::protobuf::Int32Value i;
    i.set_value(-42);
    EXPECT_EQ(s2_proto::unpack<int32_t>(i), -42);

    google::protobuf::FloatValue f;
    f.set_value(0.25f);
    EXPECT_FLOAT_EQ(s2_proto::unpack<float>(f), 0.25f);

    google::protobuf::StringValue s;
    s.set_value("moved");
    EXPECT_EQ(s2_proto::unpack<std::string>(std::move(s)), "moved");
}

TEST(Wrappers, OptionalWrapperIsNullableScalar)
{
    std::optional<uint32_t> none;
    EXPECT_FALSE(s2_proto::pack<std::optional<google::protobuf::UInt32Value>>(none).has_value());

    std::optional<uint32_t> some = 7u;
    auto wire = s2_proto::pack<std::optional<google::protobuf::UInt32Value>>(some);
    ASSERT_TRUE(wire.has_value());
    EXPECT_EQ(wire->value(), 7u);
    EXPECT_EQ(s2_proto::unpack<std::optional<uint32_t>>(wire), some);
}

TEST(Wrappers, RequiredWrapperAbsentIsValueNotPresent)
{
    std::optional<google::protobuf::Int64Value> absent;
    try
    {
        (void)s2_proto::unpack<int64_t>(absent);
        FAIL() << "expected ConversionError";
    }
    catch (const ConversionError& e)
    {
        EXPECT_EQ(e.kind(), ConversionError::Kind::ValueNotPresent);
    }
}
