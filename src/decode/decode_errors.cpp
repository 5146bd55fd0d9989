#include "widerow/decode/decode_errors.hpp"

namespace widerow::decode {

namespace {

class DecodeErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "widerow.decode";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<DecodeErrc>(condition)) {
        case DecodeErrc::Success:
            return "success";
        case DecodeErrc::ArityMismatch:
            return "unexpected number of columns";
        case DecodeErrc::NullValue:
            return "null value assigned to concrete type";
        case DecodeErrc::MalformedValue:
            return "malformed column value";
        case DecodeErrc::InvalidConfiguration:
            return "invalid decoder configuration";
        default:
            return "unknown decode error";
        }
    }
};

const DecodeErrorCategory kCategory{};

std::string describe_arity(std::size_t expected_min, std::size_t expected_max, std::size_t actual)
{
    std::string text = "expected ";
    if (expected_min == expected_max) {
        text += std::to_string(expected_max);
    } else {
        text += std::to_string(expected_max) + " or " + std::to_string(expected_min);
    }
    text += ", returned " + std::to_string(actual);
    return text;
}

}  // namespace

const std::error_category& decode_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(DecodeErrc value) noexcept
{
    return {static_cast<int>(value), decode_error_category()};
}

DecodeError::DecodeError(DecodeErrc code, const std::string& message)
    : std::system_error{make_error_code(code), message}
{}

ArityError::ArityError(std::size_t expected, std::size_t actual)
    : ArityError{expected, expected, actual}
{}

ArityError::ArityError(std::size_t expected_min, std::size_t expected_max, std::size_t actual)
    : DecodeError{DecodeErrc::ArityMismatch, describe_arity(expected_min, expected_max, actual)}
    , expected_min_{expected_min}
    , expected_max_{expected_max}
    , actual_{actual}
{}

NullValueError::NullValueError(std::string_view type_name)
    : DecodeError{DecodeErrc::NullValue,
                  "absent column cannot populate " + std::string{type_name} + "; use an optional field instead"}
{}

MalformedValueError::MalformedValueError(std::string_view type_name, const std::string& detail)
    : DecodeError{DecodeErrc::MalformedValue, std::string{type_name} + ": " + detail}
{}

ConfigurationError::ConfigurationError(const std::string& message)
    : DecodeError{DecodeErrc::InvalidConfiguration, message}
{}

}  // namespace widerow::decode
