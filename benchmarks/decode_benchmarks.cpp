#include "widerow/decode/decoder.hpp"
#include "widerow/decode/decoder_schema.hpp"
#include "widerow/decode/row_batch_decoder.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

namespace
{

using Clock = std::chrono::steady_clock;
using widerow::decode::ByteBuffer;
using widerow::decode::ColumnValue;
using widerow::decode::RowData;

using EventRow = std::tuple<std::string, std::int64_t, std::optional<std::int32_t>, double>;
constexpr std::string_view event_schema = "(string, int64, optional<int32>, float64)";
constexpr std::size_t rows_per_batch = 256U;

ByteBuffer big_endian(std::uint64_t value, std::size_t width)
{
    ByteBuffer bytes(width);
    for (std::size_t index = 0U; index < width; ++index) {
        bytes[width - 1U - index] = static_cast<std::byte>(value & 0xFFU);
        value >>= 8U;
    }
    return bytes;
}

std::vector<RowData> make_rows()
{
    std::vector<RowData> rows;
    rows.reserve(rows_per_batch);
    for (std::size_t index = 0U; index < rows_per_batch; ++index) {
        std::vector<ColumnValue> columns;
        columns.push_back(big_endian(1'700'000'000'000ULL + index, 8U));
        if (index % 4U == 0U) {
            columns.emplace_back(std::nullopt);
        } else {
            columns.push_back(big_endian(index, 4U));
        }
        columns.push_back(big_endian(0x3FF8000000000000ULL, 8U));  // 1.5
        // The leading string field comes from the row key.
        rows.emplace_back(widerow::decode::to_byte_buffer("event-" + std::to_string(index)), std::move(columns));
    }
    return rows;
}

std::size_t parse_iterations_from_args(int argc, char** argv, std::size_t default_iterations)
{
    for (int index = 1; index < argc; ++index) {
        std::string_view arg{argv[index]};
        if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: widerow_benchmarks [--iterations N]\n";
            std::exit(EXIT_SUCCESS);
        }
        if ((arg == "--iterations" || arg == "-n") && index + 1 < argc) {
            const auto value = std::strtoull(argv[index + 1], nullptr, 10);
            if (value > 0U) {
                return static_cast<std::size_t>(value);
            }
        }
    }

    return default_iterations;
}

struct BenchmarkSummary final {
    std::size_t iterations = 0U;
    std::size_t rows = 0U;
    std::size_t present_optionals = 0U;
    Clock::duration elapsed{};
};

BenchmarkSummary run_compile_time(const std::vector<RowData>& rows, std::size_t iterations)
{
    BenchmarkSummary summary{};
    summary.iterations = iterations;
    widerow::decode::RowBatchDecoder batch;

    const auto start = Clock::now();
    for (std::size_t iteration = 0; iteration < iterations; ++iteration) {
        const auto values = batch.decode_rows<EventRow>(rows);
        summary.rows += values.size();
        for (const auto& value : values) {
            if (std::get<2>(value).has_value()) {
                ++summary.present_optionals;
            }
        }
    }
    summary.elapsed = Clock::now() - start;
    return summary;
}

BenchmarkSummary run_runtime(const std::vector<RowData>& rows, std::size_t iterations)
{
    BenchmarkSummary summary{};
    summary.iterations = iterations;
    widerow::decode::RowBatchDecoder batch;
    const auto decoder = widerow::decode::compile_decoder_schema(event_schema);

    const auto start = Clock::now();
    for (std::size_t iteration = 0; iteration < iterations; ++iteration) {
        const auto values = batch.decode_rows(*decoder, rows);
        summary.rows += values.size();
        for (const auto& value : values) {
            if (value.get<widerow::decode::TupleValue>().elements[2].has_value()) {
                ++summary.present_optionals;
            }
        }
    }
    summary.elapsed = Clock::now() - start;
    return summary;
}

void report_summary(std::string_view name, const BenchmarkSummary& summary)
{
    const auto seconds = std::chrono::duration<double>(summary.elapsed).count();
    const auto rows_per_second = seconds > 0.0 ? static_cast<double>(summary.rows) / seconds : 0.0;

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Scenario: " << name << "\n";
    std::cout << "  Batches: " << summary.iterations << "\n";
    std::cout << "  Rows: " << summary.rows << "\n";
    std::cout << "  Present optionals: " << summary.present_optionals << "\n";
    std::cout << "  Elapsed: " << seconds << " s\n";
    std::cout << "  Rows/s: " << rows_per_second << "\n";
    std::cout << std::defaultfloat;
}

}  // namespace

int main(int argc, char** argv)
{
    constexpr std::size_t default_iterations = 1000U;
    const auto iterations = parse_iterations_from_args(argc, argv, default_iterations);
    const auto rows = make_rows();

    report_summary("compile_time_tuple", run_compile_time(rows, iterations));
    report_summary("runtime_schema", run_runtime(rows, iterations));

    return 0;
}
