#pragma once

#include <s2_proto/errors.hpp>

#include <optional>
#include <type_traits>
#include <utility>

namespace s2_proto
{

/**
 * @brief Native <-> wire conversion for one (Native, Wire) pairing.
 *
 * Specializations provide
 *   static Wire pack(Native value);
 *   static Native unpack(Wire value);
 * and throw ConversionError on failure. The pairing is picked at compile time,
 * so one native type may have several wire forms (e.g. T and std::optional<T>).
 * The primary template is empty: an unsupported pairing has no pack/unpack.
 */
template <typename Native, typename Wire, typename Enable = void>
struct Converter
{
};

template <typename Native, typename Wire, typename = void>
struct HasConverter : std::false_type
{
};

template <typename Native, typename Wire>
struct HasConverter<Native, Wire,
                    std::void_t<decltype(Converter<Native, Wire>::pack(std::declval<Native>())), decltype(Converter<Native, Wire>::unpack(std::declval<Wire>()))>>
  : std::true_type
{
};

template <typename T>
struct IsOptional : std::false_type
{
};

template <typename T>
struct IsOptional<std::optional<T>> : std::true_type
{
};

template <typename Wire, typename Native>
Wire pack(Native value)
{
    static_assert(HasConverter<Native, Wire>::value, "no s2_proto::Converter for this (native, wire) pairing");
    return Converter<Native, Wire>::pack(std::move(value));
}

template <typename Native, typename Wire>
Native unpack(Wire value)
{
    static_assert(HasConverter<Native, Wire>::value, "no s2_proto::Converter for this (native, wire) pairing");
    return Converter<Native, Wire>::unpack(std::move(value));
}

// Optional native <-> optional wire. Absence stays absence in both directions.
template <typename Native, typename Wire>
struct Converter<std::optional<Native>, std::optional<Wire>, std::enable_if_t<HasConverter<Native, Wire>::value>>
{
    static std::optional<Wire> pack(std::optional<Native> value)
    {
        if (!value.has_value())
        {
            return std::nullopt;
        }
        return Converter<Native, Wire>::pack(std::move(*value));
    }

    static std::optional<Native> unpack(std::optional<Wire> value)
    {
        if (!value.has_value())
        {
            return std::nullopt;
        }
        return Converter<Native, Wire>::unpack(std::move(*value));
    }
};

// Required native <-> optional wire. An absent wire value is a ValueNotPresent error.
template <typename Native, typename Wire>
struct Converter<Native, std::optional<Wire>, std::enable_if_t<std::conjunction<std::negation<IsOptional<Native>>, HasConverter<Native, Wire>>::value>>
{
    static std::optional<Wire> pack(Native value)
    {
        return Converter<Native, Wire>::pack(std::move(value));
    }

    static Native unpack(std::optional<Wire> value)
    {
        if (!value.has_value())
        {
            throw ConversionError::valueNotPresent();
        }
        return Converter<Native, Wire>::unpack(std::move(*value));
    }
};

// Reads a singular message field with explicit presence, e.g. optionalField(msg.has_stamp(), msg.stamp()).
template <typename Wire>
std::optional<Wire> optionalField(bool present, const Wire& value)
{
    if (!present)
    {
        return std::nullopt;
    }
    return value;
}

}  // namespace s2_proto
