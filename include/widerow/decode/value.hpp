#pragma once

#include "widerow/decode/decimal.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace widerow::decode {

class Value;

struct TupleValue final {
    std::vector<Value> elements;
};

bool operator==(const TupleValue& lhs, const TupleValue& rhs);

// Decoded column value for callers that only know the row shape at run time.
// std::monostate is the "no value" state produced by optional decoders.
class Value final {
public:
    using Storage = std::variant<std::monostate,
                                 bool,
                                 std::int16_t,
                                 std::int32_t,
                                 std::int64_t,
                                 float,
                                 double,
                                 Decimal,
                                 std::string,
                                 TupleValue>;

    Value() = default;
    Value(Storage storage)
        : storage_{std::move(storage)}
    {}

    [[nodiscard]] bool has_value() const noexcept
    {
        return !std::holds_alternative<std::monostate>(storage_);
    }

    template <typename T>
    [[nodiscard]] bool holds() const noexcept
    {
        return std::holds_alternative<T>(storage_);
    }

    template <typename T>
    [[nodiscard]] const T& get() const
    {
        return std::get<T>(storage_);
    }

    [[nodiscard]] const Storage& storage() const noexcept { return storage_; }

    friend bool operator==(const Value& lhs, const Value& rhs);

private:
    Storage storage_{};
};

[[nodiscard]] Value make_tuple_value(std::vector<Value> elements);

// Text rendering: null, true/false, numbers, decimals in canonical form, quoted strings, (a, b) tuples.
[[nodiscard]] std::string to_string(const Value& value);

}  // namespace widerow::decode
