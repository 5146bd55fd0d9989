#include "widerow/decode/value.hpp"

#include <array>
#include <charconv>
#include <type_traits>

namespace widerow::decode {
namespace {

template <typename Floating>
std::string format_floating(Floating value)
{
    std::array<char, 64> buffer{};
    const auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (result.ec != std::errc{}) {
        return std::to_string(value);
    }
    return std::string(buffer.data(), result.ptr);
}

void append_quoted(std::string& out, const std::string& text)
{
    out.push_back('"');
    for (const char ch : text) {
        if (ch == '"' || ch == '\\') {
            out.push_back('\\');
        }
        out.push_back(ch);
    }
    out.push_back('"');
}

void append_value(std::string& out, const Value& value)
{
    std::visit(
        [&out](const auto& alternative) {
            using Alternative = std::decay_t<decltype(alternative)>;
            if constexpr (std::is_same_v<Alternative, std::monostate>) {
                out.append("null");
            } else if constexpr (std::is_same_v<Alternative, bool>) {
                out.append(alternative ? "true" : "false");
            } else if constexpr (std::is_same_v<Alternative, float> || std::is_same_v<Alternative, double>) {
                out.append(format_floating(alternative));
            } else if constexpr (std::is_integral_v<Alternative>) {
                out.append(std::to_string(alternative));
            } else if constexpr (std::is_same_v<Alternative, Decimal>) {
                out.append(alternative.to_string());
            } else if constexpr (std::is_same_v<Alternative, std::string>) {
                append_quoted(out, alternative);
            } else {
                out.push_back('(');
                bool first = true;
                for (const auto& element : alternative.elements) {
                    if (!first) {
                        out.append(", ");
                    }
                    first = false;
                    append_value(out, element);
                }
                out.push_back(')');
            }
        },
        value.storage());
}

}  // namespace

bool operator==(const TupleValue& lhs, const TupleValue& rhs)
{
    return lhs.elements == rhs.elements;
}

bool operator==(const Value& lhs, const Value& rhs)
{
    return lhs.storage_ == rhs.storage_;
}

Value make_tuple_value(std::vector<Value> elements)
{
    return Value{TupleValue{std::move(elements)}};
}

std::string to_string(const Value& value)
{
    std::string text;
    append_value(text, value);
    return text;
}

}  // namespace widerow::decode
