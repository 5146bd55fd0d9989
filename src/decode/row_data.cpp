#include "widerow/decode/row_data.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace widerow::decode {

RowData::RowData(ByteBuffer row_key, std::vector<ColumnValue> columns)
    : row_key_{std::move(row_key)}
    , columns_{std::move(columns)}
{}

std::span<const std::byte> RowData::row_key() const noexcept
{
    return {row_key_.data(), row_key_.size()};
}

std::size_t RowData::column_count() const noexcept
{
    return columns_.size();
}

const ColumnValue& RowData::column(std::size_t index) const
{
    if (index >= columns_.size()) {
        throw std::out_of_range{"RowData column index " + std::to_string(index) + " out of range (" +
                                std::to_string(columns_.size()) + " columns)"};
    }
    return columns_[index];
}

RowData RowData::column_slice(std::size_t index) const
{
    std::vector<ColumnValue> single;
    single.reserve(1U);
    single.push_back(column(index));
    return RowData{row_key_, std::move(single)};
}

RowData RowData::with_row_key_column() const
{
    std::vector<ColumnValue> expanded;
    expanded.reserve(columns_.size() + 1U);
    expanded.emplace_back(row_key_);
    expanded.insert(expanded.end(), columns_.begin(), columns_.end());
    return RowData{row_key_, std::move(expanded)};
}

ByteBuffer to_byte_buffer(std::string_view text)
{
    ByteBuffer buffer(text.size());
    for (std::size_t index = 0U; index < text.size(); ++index) {
        buffer[index] = static_cast<std::byte>(static_cast<unsigned char>(text[index]));
    }
    return buffer;
}

ByteBuffer to_byte_buffer(std::span<const std::byte> bytes)
{
    return ByteBuffer(bytes.begin(), bytes.end());
}

}  // namespace widerow::decode
