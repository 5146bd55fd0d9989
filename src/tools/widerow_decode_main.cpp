#include "widerow/decode/decode_telemetry.hpp"
#include "widerow/decode/decoder_schema.hpp"
#include "widerow/decode/primitive_decoder_registry.hpp"
#include "widerow/decode/row_batch_decoder.hpp"
#include "widerow/decode/value.hpp"
#include "widerow/tools/cli_input.hpp"
#include "widerow/tools/decode_log_formatter.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using widerow::decode::RowData;
using widerow::decode::Value;

namespace {

constexpr std::string_view kBatchTelemetryIdentifier = "widerow_decode.batch";

void print_value(const Value& value, const std::string& format)
{
    if (format == "json") {
        std::cout << widerow::tools::format_value_json(value) << '\n';
    } else {
        std::cout << widerow::decode::to_string(value) << '\n';
    }
}

void run_decode(const std::string& schema,
                const std::string& row_key_token,
                const std::vector<std::string>& column_tokens,
                const std::string& format)
{
    const auto decoder = widerow::decode::compile_decoder_schema(schema);

    auto row_key = widerow::tools::parse_column_token(row_key_token);
    if (!row_key.has_value()) {
        throw std::invalid_argument("row key cannot be absent");
    }
    std::vector<widerow::decode::ColumnValue> columns;
    columns.reserve(column_tokens.size());
    for (const auto& token : column_tokens) {
        columns.push_back(widerow::tools::parse_column_token(token));
    }

    const RowData row{std::move(*row_key), std::move(columns)};
    print_value(decoder->decode(row), format);
}

std::vector<RowData> read_rows(std::istream& input)
{
    std::vector<RowData> rows;
    std::string line;
    std::size_t line_number = 0U;
    while (std::getline(input, line)) {
        ++line_number;
        if (widerow::tools::is_blank_or_comment_line(line)) {
            continue;
        }
        try {
            rows.push_back(widerow::tools::parse_row_line(line));
        } catch (const std::invalid_argument& error) {
            throw std::invalid_argument("line " + std::to_string(line_number) + ": " + error.what());
        }
    }
    return rows;
}

void run_batch(const std::string& schema,
               const std::string& input_path,
               bool skip_invalid,
               bool log_json,
               const std::string& format)
{
    const auto decoder = widerow::decode::compile_decoder_schema(schema);

    std::vector<RowData> rows;
    if (input_path.empty() || input_path == "-") {
        rows = read_rows(std::cin);
    } else {
        std::ifstream stream{input_path};
        if (!stream) {
            throw std::runtime_error("failed to open input file '" + input_path + "'");
        }
        rows = read_rows(stream);
    }

    widerow::decode::DecodeTelemetryRegistry registry;
    widerow::decode::RowBatchDecoder::Config config{};
    config.failure_policy = skip_invalid ? widerow::decode::DecodeFailurePolicy::SkipRow
                                         : widerow::decode::DecodeFailurePolicy::Abort;
    config.telemetry_registry = &registry;
    config.telemetry_identifier = std::string{kBatchTelemetryIdentifier};

    widerow::decode::RowBatchDecoder batch{config};

    auto emit_log = [&]() {
        if (log_json) {
            std::cerr << widerow::tools::format_decode_log_json(config.telemetry_identifier, registry.aggregate())
                      << '\n';
        }
    };

    std::vector<Value> values;
    try {
        values = batch.decode_rows(*decoder, rows);
    } catch (const widerow::decode::DecodeError&) {
        emit_log();
        throw;
    }

    for (const auto& value : values) {
        print_value(value, format);
    }
    emit_log();
}

void list_types()
{
    for (const auto& name : widerow::decode::primitive_decoder_names()) {
        const auto* entry = widerow::decode::find_primitive_decoder(name);
        if (entry != nullptr) {
            std::cout << widerow::tools::format_type_listing(*entry) << '\n';
        }
    }
}

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Typed decoding of wide-column row data"};
    app.require_subcommand(1);

    std::string decode_schema;
    std::string decode_row_key;
    std::vector<std::string> decode_columns;
    std::string decode_format = "text";

    auto* decode = app.add_subcommand("decode", "Decode a single row against a decoder schema");
    decode->add_option("-s,--schema", decode_schema, "Decoder schema, e.g. (int32, optional<string>)")->required();
    decode->add_option("-k,--row-key", decode_row_key, "Row key token")->required();
    decode->add_option("-c,--column", decode_columns, "Column token (repeat for each column)");
    decode->add_option("-f,--format", decode_format, "Output format (text or json)")
        ->transform(CLI::CheckedTransformer({{"json", "json"}, {"text", "text"}}));
    decode->callback([&]() {
        run_decode(decode_schema, decode_row_key, decode_columns, decode_format);
    });

    std::string batch_schema;
    std::string batch_input_path;
    bool batch_skip_invalid = false;
    bool batch_log_json = false;
    std::string batch_format = "text";

    auto* batch = app.add_subcommand("batch", "Decode one row per input line");
    batch->add_option("-s,--schema", batch_schema, "Decoder schema")->required();
    batch->add_option("-i,--input", batch_input_path, "Read rows from a file instead of stdin");
    batch->add_flag("--skip-invalid", batch_skip_invalid, "Skip rows that fail to decode instead of aborting");
    batch->add_flag("--log-json", batch_log_json, "Write a JSON telemetry log line to stderr");
    batch->add_option("-f,--format", batch_format, "Output format (text or json)")
        ->transform(CLI::CheckedTransformer({{"json", "json"}, {"text", "text"}}));
    batch->callback([&]() {
        run_batch(batch_schema, batch_input_path, batch_skip_invalid, batch_log_json, batch_format);
    });

    auto* types = app.add_subcommand("types", "List registered primitive type names");
    types->callback([]() { list_types(); });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        return app.exit(error);
    } catch (const std::exception& error) {
        std::cerr << "error: " << error.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
