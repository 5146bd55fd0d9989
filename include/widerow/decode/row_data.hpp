#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace widerow::decode {

using ByteBuffer = std::vector<std::byte>;
using ColumnValue = std::optional<ByteBuffer>;

// One scanned row: the row key plus the requested columns in declared field order.
class RowData final {
public:
    RowData() = default;
    RowData(ByteBuffer row_key, std::vector<ColumnValue> columns);

    [[nodiscard]] std::span<const std::byte> row_key() const noexcept;
    [[nodiscard]] std::size_t column_count() const noexcept;
    [[nodiscard]] const ColumnValue& column(std::size_t index) const;

    // Singleton holder carrying the same row key and only column `index`.
    [[nodiscard]] RowData column_slice(std::size_t index) const;

    // Holder whose first column is the row key, followed by every existing column.
    [[nodiscard]] RowData with_row_key_column() const;

private:
    ByteBuffer row_key_{};
    std::vector<ColumnValue> columns_{};
};

[[nodiscard]] ByteBuffer to_byte_buffer(std::string_view text);
[[nodiscard]] ByteBuffer to_byte_buffer(std::span<const std::byte> bytes);

}  // namespace widerow::decode
