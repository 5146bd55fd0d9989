#include "widerow/tools/decode_log_formatter.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <type_traits>
#include <variant>

namespace {

void append_json_string(std::string& out, const std::string& text)
{
    out.push_back('"');
    for (unsigned char ch : text) {
        switch (ch) {
        case '"':
            out.append("\\\"");
            break;
        case '\\':
            out.append("\\\\");
            break;
        case '\b':
            out.append("\\b");
            break;
        case '\f':
            out.append("\\f");
            break;
        case '\n':
            out.append("\\n");
            break;
        case '\r':
            out.append("\\r");
            break;
        case '\t':
            out.append("\\t");
            break;
        default:
            if (ch < 0x20U) {
                constexpr char kHex[] = "0123456789ABCDEF";
                out.append("\\u00");
                out.push_back(kHex[(ch >> 4U) & 0x0F]);
                out.push_back(kHex[ch & 0x0F]);
            } else {
                out.push_back(static_cast<char>(ch));
            }
            break;
        }
    }
    out.push_back('"');
}

template <typename Floating>
void append_json_floating(std::string& out, Floating value)
{
    // JSON has no encoding for NaN or infinities.
    if (!std::isfinite(value)) {
        out.append("null");
        return;
    }
    std::array<char, 64> buffer{};
    const auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (result.ec != std::errc{}) {
        out.append("null");
        return;
    }
    out.append(buffer.data(), result.ptr);
}

void append_json_value(std::string& out, const widerow::decode::Value& value)
{
    std::visit(
        [&out](const auto& alternative) {
            using Alternative = std::decay_t<decltype(alternative)>;
            if constexpr (std::is_same_v<Alternative, std::monostate>) {
                out.append("null");
            } else if constexpr (std::is_same_v<Alternative, bool>) {
                out.append(alternative ? "true" : "false");
            } else if constexpr (std::is_same_v<Alternative, float> || std::is_same_v<Alternative, double>) {
                append_json_floating(out, alternative);
            } else if constexpr (std::is_integral_v<Alternative>) {
                out.append(std::to_string(alternative));
            } else if constexpr (std::is_same_v<Alternative, widerow::decode::Decimal>) {
                // Decimals are emitted as strings to keep full precision.
                append_json_string(out, alternative.to_string());
            } else if constexpr (std::is_same_v<Alternative, std::string>) {
                append_json_string(out, alternative);
            } else {
                out.push_back('[');
                bool first = true;
                for (const auto& element : alternative.elements) {
                    if (!first) {
                        out.push_back(',');
                    }
                    first = false;
                    append_json_value(out, element);
                }
                out.push_back(']');
            }
        },
        value.storage());
}

}  // namespace

namespace widerow::tools {

std::string format_decode_log_json(const std::string& identifier,
                                   const widerow::decode::DecodeTelemetrySnapshot& snapshot)
{
    std::string json;
    json.reserve(320U);
    json.push_back('{');
    bool first = true;

    auto append_field = [&](const char* name) {
        if (!first) {
            json.push_back(',');
        }
        first = false;
        json.push_back('"');
        json.append(name);
        json.push_back('"');
        json.push_back(':');
    };

    auto append_number_field = [&](const char* name, auto value) {
        append_field(name);
        json.append(std::to_string(value));
    };

    append_field("identifier");
    append_json_string(json, identifier);
    append_number_field("rows_attempted", snapshot.rows_attempted);
    append_number_field("rows_decoded", snapshot.rows_decoded);
    append_number_field("rows_skipped", snapshot.rows_skipped);
    append_number_field("arity_errors", snapshot.arity_errors);
    append_number_field("null_value_errors", snapshot.null_value_errors);
    append_number_field("malformed_value_errors", snapshot.malformed_value_errors);
    append_number_field("configuration_errors", snapshot.configuration_errors);
    append_number_field("total_decode_duration_ns", snapshot.total_decode_duration_ns);
    append_number_field("last_decode_duration_ns", snapshot.last_decode_duration_ns);

    json.push_back('}');
    return json;
}

std::string format_value_json(const widerow::decode::Value& value)
{
    std::string json;
    append_json_value(json, value);
    return json;
}

std::string format_type_listing(const widerow::decode::PrimitiveDecoderEntry& entry)
{
    if (entry.fixed_width == 0U) {
        return entry.name + " variable";
    }
    return entry.name + ' ' + std::to_string(entry.fixed_width) + (entry.fixed_width == 1U ? " byte" : " bytes");
}

}  // namespace widerow::tools
