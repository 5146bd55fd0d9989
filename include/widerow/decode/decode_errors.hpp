#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>

namespace widerow::decode {

enum class DecodeErrc {
    Success = 0,
    ArityMismatch,
    NullValue,
    MalformedValue,
    InvalidConfiguration
};

const std::error_category& decode_error_category() noexcept;
std::error_code make_error_code(DecodeErrc value) noexcept;

class DecodeError : public std::system_error {
public:
    DecodeError(DecodeErrc code, const std::string& message);
};

class ArityError final : public DecodeError {
public:
    ArityError(std::size_t expected, std::size_t actual);
    ArityError(std::size_t expected_min, std::size_t expected_max, std::size_t actual);

    [[nodiscard]] std::size_t expected_min() const noexcept { return expected_min_; }
    [[nodiscard]] std::size_t expected_max() const noexcept { return expected_max_; }
    [[nodiscard]] std::size_t actual() const noexcept { return actual_; }

private:
    std::size_t expected_min_ = 0U;
    std::size_t expected_max_ = 0U;
    std::size_t actual_ = 0U;
};

class NullValueError final : public DecodeError {
public:
    explicit NullValueError(std::string_view type_name);
};

class MalformedValueError final : public DecodeError {
public:
    MalformedValueError(std::string_view type_name, const std::string& detail);
};

class ConfigurationError final : public DecodeError {
public:
    explicit ConfigurationError(const std::string& message);
};

}  // namespace widerow::decode

namespace std {

template <>
struct is_error_code_enum<widerow::decode::DecodeErrc> : true_type {
};

}  // namespace std
