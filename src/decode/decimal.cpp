#include "widerow/decode/decimal.hpp"

#include <algorithm>
#include <utility>

namespace widerow::decode {
namespace {

void strip_leading_zeros(std::vector<std::uint8_t>& bytes)
{
    const auto first = std::find_if(bytes.begin(), bytes.end(), [](std::uint8_t value) { return value != 0U; });
    bytes.erase(bytes.begin(), first);
}

void negate_in_place(std::vector<std::uint8_t>& bytes)
{
    for (auto& value : bytes) {
        value = static_cast<std::uint8_t>(~value);
    }
    for (auto it = bytes.rbegin(); it != bytes.rend(); ++it) {
        *it = static_cast<std::uint8_t>(*it + 1U);
        if (*it != 0U) {
            break;
        }
    }
}

}  // namespace

Decimal::Decimal(std::vector<std::uint8_t> magnitude, bool negative, std::int32_t scale)
    : magnitude_{std::move(magnitude)}
    , negative_{negative}
    , scale_{scale}
{
    strip_leading_zeros(magnitude_);
    if (magnitude_.empty()) {
        negative_ = false;
    }
}

Decimal Decimal::from_twos_complement(std::span<const std::byte> unscaled, std::int32_t scale)
{
    std::vector<std::uint8_t> bytes;
    bytes.reserve(unscaled.size());
    for (const auto value : unscaled) {
        bytes.push_back(std::to_integer<std::uint8_t>(value));
    }

    const bool negative = !bytes.empty() && (bytes.front() & 0x80U) != 0U;
    if (negative) {
        negate_in_place(bytes);
    }
    return Decimal{std::move(bytes), negative, scale};
}

Decimal Decimal::from_int64(std::int64_t unscaled, std::int32_t scale)
{
    const bool negative = unscaled < 0;
    auto remaining = negative ? std::uint64_t{0U} - static_cast<std::uint64_t>(unscaled)
                              : static_cast<std::uint64_t>(unscaled);

    std::vector<std::uint8_t> bytes(sizeof(std::uint64_t));
    for (auto it = bytes.rbegin(); it != bytes.rend(); ++it) {
        *it = static_cast<std::uint8_t>(remaining & 0xFFU);
        remaining >>= 8U;
    }
    return Decimal{std::move(bytes), negative, scale};
}

std::string Decimal::unscaled_string() const
{
    if (magnitude_.empty()) {
        return "0";
    }

    std::vector<std::uint8_t> work = magnitude_;
    std::string digits;
    while (!work.empty()) {
        std::uint32_t remainder = 0U;
        for (auto& value : work) {
            const std::uint32_t current = (remainder << 8U) | value;
            value = static_cast<std::uint8_t>(current / 10U);
            remainder = current % 10U;
        }
        digits.push_back(static_cast<char>('0' + remainder));
        strip_leading_zeros(work);
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

std::string Decimal::to_string() const
{
    const auto digits = unscaled_string();
    std::string text = negative_ ? "-" : "";
    if (scale_ == 0) {
        return text + digits;
    }

    const auto length = static_cast<std::int64_t>(digits.size());
    const auto adjusted = -static_cast<std::int64_t>(scale_) + (length - 1);

    if (scale_ > 0 && adjusted >= -6) {
        const auto scale = static_cast<std::int64_t>(scale_);
        if (length > scale) {
            const auto integral = static_cast<std::size_t>(length - scale);
            text += digits.substr(0U, integral);
            text.push_back('.');
            text += digits.substr(integral);
        } else {
            text += "0.";
            text.append(static_cast<std::size_t>(scale - length), '0');
            text += digits;
        }
        return text;
    }

    text.push_back(digits.front());
    if (digits.size() > 1U) {
        text.push_back('.');
        text += digits.substr(1U);
    }
    if (adjusted != 0) {
        text.push_back('E');
        if (adjusted > 0) {
            text.push_back('+');
        }
        text += std::to_string(adjusted);
    }
    return text;
}

bool operator==(const Decimal& lhs, const Decimal& rhs) noexcept
{
    return lhs.scale_ == rhs.scale_ && lhs.negative_ == rhs.negative_ && lhs.magnitude_ == rhs.magnitude_;
}

}  // namespace widerow::decode
