#pragma once

#include "widerow/decode/value_decoder.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace widerow::decode {

inline constexpr std::size_t kMaxSchemaDepth = 64U;

enum class SchemaNodeKind : std::uint8_t {
    Primitive = 0,
    Optional,
    Product
};

struct SchemaNode final {
    SchemaNodeKind kind = SchemaNodeKind::Primitive;
    std::string type_name{};
    std::vector<SchemaNode> children{};
};

struct SchemaDiagnostic final {
    std::string message{};
    std::size_t line = 0U;
    std::size_t column = 0U;
};

struct SchemaParseResult final {
    std::optional<SchemaNode> schema{};
    std::vector<SchemaDiagnostic> diagnostics{};

    [[nodiscard]] bool success() const noexcept { return schema.has_value(); }
};

// Grammar: type := name | "optional" "<" type ">" | "(" type ("," type)* ")"
[[nodiscard]] SchemaParseResult parse_decoder_schema(std::string_view text);

[[nodiscard]] ValueDecoderPtr resolve_decoder_schema(const SchemaNode& schema);
[[nodiscard]] ValueDecoderPtr compile_decoder_schema(std::string_view text);

}  // namespace widerow::decode
