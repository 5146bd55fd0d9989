#include "widerow/decode/column_codec.hpp"

#include "widerow/decode/decode_errors.hpp"

#include <cstring>

namespace widerow::decode {
namespace {

constexpr std::size_t kDecimalScaleWidth = sizeof(std::int32_t);

template <typename Floating, typename Bits>
Floating floating_from_bits(Bits bits) noexcept
{
    static_assert(sizeof(Floating) == sizeof(Bits), "bit pattern width must match the floating type");
    Floating value{};
    std::memcpy(&value, &bits, sizeof(Floating));
    return value;
}

}  // namespace

std::uint64_t load_big_endian(std::span<const std::byte> bytes, std::size_t width, std::string_view type_name)
{
    if (width == 0U || width > sizeof(std::uint64_t)) {
        throw MalformedValueError{type_name, "unsupported fixed width " + std::to_string(width)};
    }
    if (bytes.size() < width) {
        throw MalformedValueError{type_name,
                                  "expected " + std::to_string(width) + " bytes, found " + std::to_string(bytes.size())};
    }

    std::uint64_t value = 0U;
    for (std::size_t index = 0U; index < width; ++index) {
        value = (value << 8U) | std::to_integer<std::uint64_t>(bytes[index]);
    }
    return value;
}

bool ColumnCodec<bool>::decode(std::span<const std::byte> bytes)
{
    if (bytes.size() != fixed_width) {
        throw MalformedValueError{type_name, "expected exactly 1 byte, found " + std::to_string(bytes.size())};
    }
    return bytes.front() != std::byte{0};
}

std::int16_t ColumnCodec<std::int16_t>::decode(std::span<const std::byte> bytes)
{
    return static_cast<std::int16_t>(static_cast<std::uint16_t>(load_big_endian(bytes, fixed_width, type_name)));
}

std::int32_t ColumnCodec<std::int32_t>::decode(std::span<const std::byte> bytes)
{
    return static_cast<std::int32_t>(static_cast<std::uint32_t>(load_big_endian(bytes, fixed_width, type_name)));
}

std::int64_t ColumnCodec<std::int64_t>::decode(std::span<const std::byte> bytes)
{
    return static_cast<std::int64_t>(load_big_endian(bytes, fixed_width, type_name));
}

float ColumnCodec<float>::decode(std::span<const std::byte> bytes)
{
    const auto bits = static_cast<std::uint32_t>(load_big_endian(bytes, fixed_width, type_name));
    return floating_from_bits<float>(bits);
}

double ColumnCodec<double>::decode(std::span<const std::byte> bytes)
{
    const auto bits = load_big_endian(bytes, fixed_width, type_name);
    return floating_from_bits<double>(bits);
}

Decimal ColumnCodec<Decimal>::decode(std::span<const std::byte> bytes)
{
    if (bytes.size() < kDecimalScaleWidth + 1U) {
        throw MalformedValueError{type_name,
                                  "expected at least " + std::to_string(kDecimalScaleWidth + 1U) + " bytes, found " +
                                      std::to_string(bytes.size())};
    }
    const auto scale = static_cast<std::int32_t>(
        static_cast<std::uint32_t>(load_big_endian(bytes, kDecimalScaleWidth, type_name)));
    return Decimal::from_twos_complement(bytes.subspan(kDecimalScaleWidth), scale);
}

std::string ColumnCodec<std::string>::decode(std::span<const std::byte> bytes)
{
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

}  // namespace widerow::decode
