#include "widerow/decode/value_decoder.hpp"

#include <utility>

namespace widerow::decode {
namespace {

class PrimitiveValueDecoder final : public ValueDecoder {
public:
    explicit PrimitiveValueDecoder(PrimitiveDecoderEntry entry)
        : entry_{std::move(entry)}
    {}

    DecoderKind kind() const noexcept override { return DecoderKind::Primitive; }
    std::size_t arity() const noexcept override { return 1U; }
    std::string type_name() const override { return entry_.name; }

    Value decode(const RowData& row) const override
    {
        detail::require_column_count(row, 1U);
        const auto& column = row.column(0U);
        if (!column.has_value()) {
            throw NullValueError{entry_.name};
        }
        return entry_.decode(*column);
    }

private:
    PrimitiveDecoderEntry entry_;
};

class OptionalValueDecoder final : public ValueDecoder {
public:
    explicit OptionalValueDecoder(ValueDecoderPtr inner)
        : inner_{std::move(inner)}
    {}

    DecoderKind kind() const noexcept override { return DecoderKind::Optional; }
    std::size_t arity() const noexcept override { return 1U; }
    std::string type_name() const override { return "optional<" + inner_->type_name() + ">"; }

    Value decode(const RowData& row) const override
    {
        detail::require_column_count(row, 1U);
        const auto& column = row.column(0U);
        if (!column.has_value()) {
            return Value{};
        }
        return inner_->decode(row);
    }

private:
    ValueDecoderPtr inner_;
};

class ProductValueDecoder final : public ValueDecoder {
public:
    explicit ProductValueDecoder(std::vector<ValueDecoderPtr> components)
        : components_{std::move(components)}
    {}

    DecoderKind kind() const noexcept override { return DecoderKind::Product; }
    std::size_t arity() const noexcept override { return components_.size(); }

    std::string type_name() const override
    {
        std::string text = "(";
        for (std::size_t index = 0U; index < components_.size(); ++index) {
            if (index > 0U) {
                text.append(", ");
            }
            text.append(components_[index]->type_name());
        }
        text.push_back(')');
        return text;
    }

    Value decode(const RowData& row) const override
    {
        const auto columns = detail::select_product_columns(row, components_.size());
        std::vector<Value> elements;
        elements.reserve(components_.size());
        for (std::size_t index = 0U; index < components_.size(); ++index) {
            elements.push_back(components_[index]->decode(columns.column_slice(index)));
        }
        return make_tuple_value(std::move(elements));
    }

private:
    std::vector<ValueDecoderPtr> components_;
};

const char* kind_name(DecoderKind kind) noexcept
{
    switch (kind) {
    case DecoderKind::Primitive:
        return "primitive";
    case DecoderKind::Optional:
        return "optional";
    case DecoderKind::Product:
        return "product";
    default:
        return "unknown";
    }
}

}  // namespace

ValueDecoderPtr make_primitive_value_decoder(const PrimitiveDecoderEntry& entry)
{
    if (entry.name.empty() || entry.decode == nullptr) {
        throw ConfigurationError{"primitive decoder entry requires a name and a decode function"};
    }
    return std::make_shared<PrimitiveValueDecoder>(entry);
}

ValueDecoderPtr make_primitive_value_decoder(std::string_view type_name)
{
    const auto* entry = find_primitive_decoder(type_name);
    if (entry == nullptr) {
        throw ConfigurationError{"no primitive decoder registered for type '" + std::string{type_name} + "'"};
    }
    return make_primitive_value_decoder(*entry);
}

ValueDecoderPtr make_optional_value_decoder(ValueDecoderPtr inner)
{
    if (!inner) {
        throw ConfigurationError{"optional decoder requires an inner decoder"};
    }
    if (inner->kind() != DecoderKind::Primitive) {
        throw ConfigurationError{"optional decoder can only wrap a primitive decoder, not " +
                                 std::string{kind_name(inner->kind())} + " " + inner->type_name()};
    }
    return std::make_shared<OptionalValueDecoder>(std::move(inner));
}

ValueDecoderPtr make_product_value_decoder(std::vector<ValueDecoderPtr> components)
{
    if (components.size() < kMinProductArity || components.size() > kMaxProductArity) {
        throw ConfigurationError{"product decoder arity must be between " + std::to_string(kMinProductArity) +
                                 " and " + std::to_string(kMaxProductArity) + ", got " +
                                 std::to_string(components.size())};
    }
    for (std::size_t index = 0U; index < components.size(); ++index) {
        if (!components[index]) {
            throw ConfigurationError{"product decoder component " + std::to_string(index) + " is missing"};
        }
    }
    return std::make_shared<ProductValueDecoder>(std::move(components));
}

}  // namespace widerow::decode
