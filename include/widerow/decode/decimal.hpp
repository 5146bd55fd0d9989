#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace widerow::decode {

// Arbitrary precision decimal: unscaled integer x 10^-scale.
// The unscaled magnitude is kept big-endian with no leading zero bytes; zero has an empty magnitude.
class Decimal final {
public:
    Decimal() = default;

    static Decimal from_twos_complement(std::span<const std::byte> unscaled, std::int32_t scale);
    static Decimal from_int64(std::int64_t unscaled, std::int32_t scale);

    [[nodiscard]] std::int32_t scale() const noexcept { return scale_; }
    [[nodiscard]] bool negative() const noexcept { return negative_; }
    [[nodiscard]] bool is_zero() const noexcept { return magnitude_.empty(); }
    [[nodiscard]] const std::vector<std::uint8_t>& magnitude() const noexcept { return magnitude_; }

    [[nodiscard]] std::string unscaled_string() const;
    [[nodiscard]] std::string to_string() const;

    // Equal only when both value and scale match, so 1.0 and 1.00 differ.
    friend bool operator==(const Decimal& lhs, const Decimal& rhs) noexcept;

private:
    Decimal(std::vector<std::uint8_t> magnitude, bool negative, std::int32_t scale);

    std::vector<std::uint8_t> magnitude_{};
    bool negative_ = false;
    std::int32_t scale_ = 0;
};

}  // namespace widerow::decode
