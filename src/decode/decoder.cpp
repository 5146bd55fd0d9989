#include "widerow/decode/decoder.hpp"

namespace widerow::decode::detail {

void require_column_count(const RowData& row, std::size_t expected)
{
    if (row.column_count() != expected) {
        throw ArityError{expected, row.column_count()};
    }
}

RowData select_product_columns(const RowData& row, std::size_t arity)
{
    const auto count = row.column_count();
    if (count == arity) {
        return row;
    }
    if (count + 1U == arity) {
        return row.with_row_key_column();
    }
    throw ArityError{arity - 1U, arity, count};
}

}  // namespace widerow::decode::detail
