#include "widerow/tools/cli_input.hpp"

#include <cctype>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace widerow::tools {
namespace {

int hex_digit_value(char ch) noexcept
{
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

std::vector<std::string_view> split_tokens(std::string_view text)
{
    std::vector<std::string_view> tokens;
    std::size_t index = 0U;
    while (index < text.size()) {
        while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) != 0) {
            ++index;
        }
        if (index >= text.size()) {
            break;
        }
        const std::size_t begin = index;
        while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) == 0) {
            ++index;
        }
        tokens.push_back(text.substr(begin, index - begin));
    }
    return tokens;
}

}  // namespace

widerow::decode::ByteBuffer parse_hex_bytes(std::string_view text)
{
    if (text.size() >= 2U && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2U);
    }
    if (text.size() % 2U != 0U) {
        throw std::invalid_argument("hex value '" + std::string{text} + "' has an odd number of digits");
    }

    widerow::decode::ByteBuffer bytes;
    bytes.reserve(text.size() / 2U);
    for (std::size_t index = 0U; index < text.size(); index += 2U) {
        const int high = hex_digit_value(text[index]);
        const int low = hex_digit_value(text[index + 1U]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument("hex value '" + std::string{text} + "' contains a non-hex digit");
        }
        bytes.push_back(static_cast<std::byte>((high << 4) | low));
    }
    return bytes;
}

widerow::decode::ColumnValue parse_column_token(std::string_view token)
{
    if (token == "-" || token == "null") {
        return std::nullopt;
    }
    if (token.substr(0U, 2U) == "s:") {
        return widerow::decode::to_byte_buffer(token.substr(2U));
    }
    return parse_hex_bytes(token);
}

bool is_blank_or_comment_line(std::string_view line) noexcept
{
    for (const char ch : line) {
        if (std::isspace(static_cast<unsigned char>(ch)) == 0) {
            return ch == '#';
        }
    }
    return true;
}

widerow::decode::RowData parse_row_line(std::string_view line)
{
    const auto tokens = split_tokens(line);
    if (tokens.empty()) {
        throw std::invalid_argument("row line is empty");
    }

    auto row_key = parse_column_token(tokens.front());
    if (!row_key.has_value()) {
        throw std::invalid_argument("row key cannot be absent");
    }

    std::vector<widerow::decode::ColumnValue> columns;
    columns.reserve(tokens.size() - 1U);
    for (std::size_t index = 1U; index < tokens.size(); ++index) {
        columns.push_back(parse_column_token(tokens[index]));
    }
    return widerow::decode::RowData{std::move(*row_key), std::move(columns)};
}

}  // namespace widerow::tools
