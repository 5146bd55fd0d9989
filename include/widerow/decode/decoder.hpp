#pragma once

#include "widerow/decode/column_codec.hpp"
#include "widerow/decode/decode_errors.hpp"
#include "widerow/decode/row_data.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <utility>

namespace widerow::decode {

enum class DecoderKind : std::uint8_t {
    Primitive = 0,
    Optional,
    Product
};

inline constexpr std::size_t kMinProductArity = 2U;
inline constexpr std::size_t kMaxProductArity = 10U;

namespace detail {

// Throws ArityError unless the row carries exactly `expected` columns.
void require_column_count(const RowData& row, std::size_t expected);

// Returns the row unchanged when it has `arity` columns, or with the row key prepended when it
// has `arity - 1`; throws ArityError otherwise.
[[nodiscard]] RowData select_product_columns(const RowData& row, std::size_t arity);

template <typename>
inline constexpr bool kAlwaysFalse = false;

}  // namespace detail

template <typename T>
class PrimitiveDecoder final {
    static_assert(is_column_decodable_v<T>, "PrimitiveDecoder requires a ColumnCodec specialization");

public:
    using value_type = T;
    static constexpr DecoderKind kind = DecoderKind::Primitive;
    static constexpr std::size_t arity = 1U;

    [[nodiscard]] T decode(const RowData& row) const
    {
        detail::require_column_count(row, arity);
        const auto& column = row.column(0U);
        if (!column.has_value()) {
            throw NullValueError{ColumnCodec<T>::type_name};
        }
        return decode_column(*column);
    }

    [[nodiscard]] T decode_column(std::span<const std::byte> bytes) const
    {
        return ColumnCodec<T>::decode(bytes);
    }
};

template <typename Inner>
class OptionalDecoder final {
    static_assert(Inner::kind == DecoderKind::Primitive, "optional columns may only wrap a primitive decoder");

public:
    using value_type = std::optional<typename Inner::value_type>;
    static constexpr DecoderKind kind = DecoderKind::Optional;
    static constexpr std::size_t arity = 1U;

    constexpr OptionalDecoder() = default;
    explicit constexpr OptionalDecoder(Inner inner)
        : inner_{std::move(inner)}
    {}

    [[nodiscard]] value_type decode(const RowData& row) const
    {
        detail::require_column_count(row, arity);
        const auto& column = row.column(0U);
        if (!column.has_value()) {
            return std::nullopt;
        }
        return inner_.decode(row);
    }

private:
    Inner inner_{};
};

template <typename... Components>
class ProductDecoder final {
    static_assert(sizeof...(Components) >= kMinProductArity && sizeof...(Components) <= kMaxProductArity,
                  "product decoders support between 2 and 10 components");

public:
    using value_type = std::tuple<typename Components::value_type...>;
    static constexpr DecoderKind kind = DecoderKind::Product;
    static constexpr std::size_t arity = sizeof...(Components);

    constexpr ProductDecoder() = default;
    explicit constexpr ProductDecoder(Components... components)
        : components_{std::move(components)...}
    {}

    [[nodiscard]] value_type decode(const RowData& row) const
    {
        const auto columns = detail::select_product_columns(row, arity);
        return decode_components(columns, std::index_sequence_for<Components...>{});
    }

private:
    template <std::size_t... Index>
    value_type decode_components(const RowData& row, std::index_sequence<Index...>) const
    {
        // Braced initialization keeps component decoding in declared order.
        return value_type{std::get<Index>(components_).decode(row.column_slice(Index))...};
    }

    std::tuple<Components...> components_{};
};

template <typename Inner>
[[nodiscard]] constexpr OptionalDecoder<Inner> make_optional_decoder(Inner inner)
{
    return OptionalDecoder<Inner>{std::move(inner)};
}

template <typename... Components>
[[nodiscard]] constexpr ProductDecoder<Components...> make_product_decoder(Components... components)
{
    return ProductDecoder<Components...>{std::move(components)...};
}

// Compile-time resolution from an output type to the one decoder that populates it.
template <typename T, typename = void>
struct DecoderFor {
    static_assert(detail::kAlwaysFalse<T>,
                  "no decoder resolves this type; use a supported scalar, std::optional or std::tuple, "
                  "or specialize ColumnCodec");
};

template <typename T>
struct DecoderFor<T, std::enable_if_t<is_column_decodable_v<T>>> {
    using type = PrimitiveDecoder<T>;
};

template <typename T>
struct DecoderFor<std::optional<T>, std::enable_if_t<!is_column_decodable_v<std::optional<T>>>> {
    using type = OptionalDecoder<typename DecoderFor<T>::type>;
};

template <typename... Ts>
struct DecoderFor<std::tuple<Ts...>, std::enable_if_t<!is_column_decodable_v<std::tuple<Ts...>>>> {
    using type = ProductDecoder<typename DecoderFor<Ts>::type...>;
};

template <typename T>
using decoder_for_t = typename DecoderFor<T>::type;

template <typename T>
[[nodiscard]] T decode(const RowData& row)
{
    return decoder_for_t<T>{}.decode(row);
}

template <typename T>
[[nodiscard]] std::error_code try_decode(const RowData& row, T& out)
{
    try {
        out = decode<T>(row);
    } catch (const DecodeError& error) {
        return error.code();
    }
    return {};
}

}  // namespace widerow::decode
