#pragma once

#include "widerow/decode/decoder.hpp"
#include "widerow/decode/primitive_decoder_registry.hpp"
#include "widerow/decode/row_data.hpp"
#include "widerow/decode/value.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace widerow::decode {

class ValueDecoder;
using ValueDecoderPtr = std::shared_ptr<const ValueDecoder>;

// Type-erased decoder tree built at run time. Instances are immutable and safe to share across threads.
class ValueDecoder {
public:
    virtual ~ValueDecoder() = default;

    ValueDecoder(const ValueDecoder&) = delete;
    ValueDecoder& operator=(const ValueDecoder&) = delete;

    [[nodiscard]] virtual DecoderKind kind() const noexcept = 0;
    [[nodiscard]] virtual std::size_t arity() const noexcept = 0;
    [[nodiscard]] virtual std::string type_name() const = 0;
    [[nodiscard]] virtual Value decode(const RowData& row) const = 0;

protected:
    ValueDecoder() = default;
};

// All factories throw ConfigurationError for compositions the decoder model forbids.
[[nodiscard]] ValueDecoderPtr make_primitive_value_decoder(const PrimitiveDecoderEntry& entry);
[[nodiscard]] ValueDecoderPtr make_primitive_value_decoder(std::string_view type_name);
[[nodiscard]] ValueDecoderPtr make_optional_value_decoder(ValueDecoderPtr inner);
[[nodiscard]] ValueDecoderPtr make_product_value_decoder(std::vector<ValueDecoderPtr> components);

}  // namespace widerow::decode
