#pragma once

#include "widerow/decode/decimal.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace widerow::decode {

// Byte layout of one scalar column. Specialize for a new scalar type with:
//   static constexpr std::string_view type_name;
//   static T decode(std::span<const std::byte> bytes);
// The type then resolves to a primitive decoder and composes into optionals and tuples.
template <typename T>
struct ColumnCodec {
};

template <>
struct ColumnCodec<bool> final {
    static constexpr std::string_view type_name = "boolean";
    static constexpr std::size_t fixed_width = 1U;
    static bool decode(std::span<const std::byte> bytes);
};

template <>
struct ColumnCodec<std::int16_t> final {
    static constexpr std::string_view type_name = "int16";
    static constexpr std::size_t fixed_width = sizeof(std::int16_t);
    static std::int16_t decode(std::span<const std::byte> bytes);
};

template <>
struct ColumnCodec<std::int32_t> final {
    static constexpr std::string_view type_name = "int32";
    static constexpr std::size_t fixed_width = sizeof(std::int32_t);
    static std::int32_t decode(std::span<const std::byte> bytes);
};

template <>
struct ColumnCodec<std::int64_t> final {
    static constexpr std::string_view type_name = "int64";
    static constexpr std::size_t fixed_width = sizeof(std::int64_t);
    static std::int64_t decode(std::span<const std::byte> bytes);
};

template <>
struct ColumnCodec<float> final {
    static constexpr std::string_view type_name = "float32";
    static constexpr std::size_t fixed_width = sizeof(float);
    static float decode(std::span<const std::byte> bytes);
};

template <>
struct ColumnCodec<double> final {
    static constexpr std::string_view type_name = "float64";
    static constexpr std::size_t fixed_width = sizeof(double);
    static double decode(std::span<const std::byte> bytes);
};

// 4-byte big-endian scale followed by the big-endian two's complement unscaled value.
template <>
struct ColumnCodec<Decimal> final {
    static constexpr std::string_view type_name = "decimal";
    static constexpr std::size_t fixed_width = 0U;
    static Decimal decode(std::span<const std::byte> bytes);
};

template <>
struct ColumnCodec<std::string> final {
    static constexpr std::string_view type_name = "string";
    static constexpr std::size_t fixed_width = 0U;
    static std::string decode(std::span<const std::byte> bytes);
};

template <typename T, typename = void>
struct is_column_decodable : std::false_type {
};

template <typename T>
struct is_column_decodable<T, std::void_t<decltype(ColumnCodec<T>::decode(std::declval<std::span<const std::byte>>())),
                                          decltype(ColumnCodec<T>::type_name)>>
    : std::is_same<decltype(ColumnCodec<T>::decode(std::declval<std::span<const std::byte>>())), T> {
};

template <typename T>
inline constexpr bool is_column_decodable_v = is_column_decodable<T>::value;

// Reads the leading `width` bytes as an unsigned big-endian integer; throws MalformedValueError when short.
[[nodiscard]] std::uint64_t load_big_endian(std::span<const std::byte> bytes,
                                            std::size_t width,
                                            std::string_view type_name);

}  // namespace widerow::decode
