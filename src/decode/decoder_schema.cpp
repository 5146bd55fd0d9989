#include "widerow/decode/decoder_schema.hpp"

#include <tao/pegtl.hpp>

#include <cstddef>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace widerow::decode {
namespace {

namespace pegtl = tao::pegtl;

struct optional_space : pegtl::star<pegtl::space> {
};

struct type_expression;

struct primitive_name : pegtl::identifier {
};

struct kw_optional : pegtl::keyword<'o', 'p', 't', 'i', 'o', 'n', 'a', 'l'> {
};

struct optional_open : pegtl::seq<kw_optional, optional_space, pegtl::one<'<'>> {
};

struct optional_close : pegtl::one<'>'> {
};

struct optional_type : pegtl::if_must<optional_open, optional_space, type_expression, optional_space, optional_close> {
};

struct product_open : pegtl::one<'('> {
};

struct product_close : pegtl::one<')'> {
};

struct product_element : pegtl::if_must<pegtl::one<','>, optional_space, type_expression> {
};

struct product_type : pegtl::if_must<product_open,
                                     optional_space,
                                     type_expression,
                                     pegtl::star<optional_space, product_element>,
                                     optional_space,
                                     product_close> {
};

struct type_expression : pegtl::sor<optional_type, product_type, primitive_name> {
};

struct schema_grammar : pegtl::must<optional_space, type_expression, optional_space, pegtl::eof> {
};

template <typename Rule>
inline constexpr const char* kSchemaErrorMessage = "invalid decoder schema";

template <>
inline constexpr const char* kSchemaErrorMessage<type_expression> = "expected a type name, optional<...> or (...)";

template <>
inline constexpr const char* kSchemaErrorMessage<optional_close> = "expected '>' to close optional<...>";

template <>
inline constexpr const char* kSchemaErrorMessage<product_close> = "expected ',' or ')' in tuple";

template <>
inline constexpr const char* kSchemaErrorMessage<pegtl::eof> = "unexpected trailing input";

struct SchemaBuildState final {
    std::vector<SchemaNode> nodes{};
    std::vector<std::size_t> product_marks{};
    std::size_t depth = 0U;
};

template <typename Rule>
struct schema_control : pegtl::normal<Rule> {
    template <typename ParseInput, typename... States>
    [[noreturn]] static void raise(const ParseInput& in, States&&...)
    {
        throw pegtl::parse_error(kSchemaErrorMessage<Rule>, in);
    }
};

// Every nested type enters type_expression, so its depth bounds the recursion.
template <>
struct schema_control<type_expression> : pegtl::normal<type_expression> {
    template <typename ParseInput>
    static void start(const ParseInput& in, SchemaBuildState& state)
    {
        if (++state.depth > kMaxSchemaDepth) {
            throw pegtl::parse_error(
                "decoder schema nests deeper than " + std::to_string(kMaxSchemaDepth) + " levels", in);
        }
    }

    template <typename ParseInput>
    static void success(const ParseInput&, SchemaBuildState& state) noexcept
    {
        --state.depth;
    }

    template <typename ParseInput>
    static void failure(const ParseInput&, SchemaBuildState& state) noexcept
    {
        --state.depth;
    }

    template <typename ParseInput, typename... States>
    [[noreturn]] static void raise(const ParseInput& in, States&&...)
    {
        throw pegtl::parse_error(kSchemaErrorMessage<type_expression>, in);
    }
};

template <typename Rule>
struct schema_action : pegtl::nothing<Rule> {
};

template <>
struct schema_action<primitive_name> {
    template <typename ActionInput>
    static void apply(const ActionInput& in, SchemaBuildState& state)
    {
        SchemaNode node{};
        node.kind = SchemaNodeKind::Primitive;
        node.type_name = in.string();
        state.nodes.push_back(std::move(node));
    }
};

template <>
struct schema_action<optional_type> {
    template <typename ActionInput>
    static void apply(const ActionInput&, SchemaBuildState& state)
    {
        SchemaNode node{};
        node.kind = SchemaNodeKind::Optional;
        node.children.push_back(std::move(state.nodes.back()));
        state.nodes.pop_back();
        state.nodes.push_back(std::move(node));
    }
};

template <>
struct schema_action<product_open> {
    template <typename ActionInput>
    static void apply(const ActionInput&, SchemaBuildState& state)
    {
        state.product_marks.push_back(state.nodes.size());
    }
};

template <>
struct schema_action<product_type> {
    template <typename ActionInput>
    static void apply(const ActionInput&, SchemaBuildState& state)
    {
        const auto mark = state.product_marks.back();
        state.product_marks.pop_back();

        SchemaNode node{};
        node.kind = SchemaNodeKind::Product;
        const auto first = state.nodes.begin() + static_cast<std::ptrdiff_t>(mark);
        node.children.assign(std::make_move_iterator(first), std::make_move_iterator(state.nodes.end()));
        state.nodes.erase(first, state.nodes.end());
        state.nodes.push_back(std::move(node));
    }
};

std::string extract_token(std::string_view text, std::size_t offset)
{
    if (offset >= text.size()) {
        return {};
    }
    auto end = offset;
    while (end < text.size() && text[end] != ' ' && text[end] != ',' && text[end] != ')' && text[end] != '>') {
        ++end;
    }
    if (end == offset) {
        ++end;
    }
    return std::string{text.substr(offset, end - offset)};
}

SchemaDiagnostic make_parse_error(const pegtl::parse_error& error, std::string_view text)
{
    SchemaDiagnostic diagnostic{};
    diagnostic.message = std::string{error.message()};
    if (!error.positions().empty()) {
        const auto& position = error.positions().front();
        diagnostic.line = static_cast<std::size_t>(position.line);
        diagnostic.column = static_cast<std::size_t>(position.column);

        const auto byte_index = static_cast<std::size_t>(position.byte);
        if (byte_index < text.size()) {
            diagnostic.message += " near '" + extract_token(text, byte_index) + "'";
        } else {
            diagnostic.message += " at end of input";
        }
    }
    return diagnostic;
}

std::string describe(const SchemaDiagnostic& diagnostic)
{
    return diagnostic.message + " (line " + std::to_string(diagnostic.line) + ", column " +
           std::to_string(diagnostic.column) + ")";
}

}  // namespace

SchemaParseResult parse_decoder_schema(std::string_view text)
{
    SchemaParseResult result{};
    pegtl::memory_input in(text, "decoder_schema");
    SchemaBuildState state{};

    try {
        const auto parsed = pegtl::parse<schema_grammar, schema_action, schema_control>(in, state);
        if (parsed && state.nodes.size() == 1U) {
            result.schema = std::move(state.nodes.front());
        } else {
            SchemaDiagnostic diagnostic{};
            diagnostic.message = "input did not match decoder schema grammar";
            diagnostic.line = 1U;
            diagnostic.column = 1U;
            result.diagnostics.push_back(std::move(diagnostic));
        }
    } catch (const pegtl::parse_error& error) {
        result.diagnostics.push_back(make_parse_error(error, text));
    }

    return result;
}

ValueDecoderPtr resolve_decoder_schema(const SchemaNode& schema)
{
    switch (schema.kind) {
    case SchemaNodeKind::Primitive:
        return make_primitive_value_decoder(schema.type_name);
    case SchemaNodeKind::Optional:
        if (schema.children.size() != 1U) {
            throw ConfigurationError{"optional schema node requires exactly one child"};
        }
        return make_optional_value_decoder(resolve_decoder_schema(schema.children.front()));
    case SchemaNodeKind::Product: {
        std::vector<ValueDecoderPtr> components;
        components.reserve(schema.children.size());
        for (const auto& child : schema.children) {
            components.push_back(resolve_decoder_schema(child));
        }
        return make_product_value_decoder(std::move(components));
    }
    default:
        throw ConfigurationError{"unknown schema node kind"};
    }
}

ValueDecoderPtr compile_decoder_schema(std::string_view text)
{
    auto parsed = parse_decoder_schema(text);
    if (!parsed.success()) {
        const auto detail = parsed.diagnostics.empty() ? std::string{"unknown error"}
                                                       : describe(parsed.diagnostics.front());
        throw ConfigurationError{"invalid decoder schema: " + detail};
    }
    return resolve_decoder_schema(*parsed.schema);
}

}  // namespace widerow::decode
