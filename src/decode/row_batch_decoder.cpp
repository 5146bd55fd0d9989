#include "widerow/decode/row_batch_decoder.hpp"

#include <utility>

namespace widerow::decode {
namespace {

std::uint64_t elapsed_ns(std::chrono::steady_clock::time_point start) noexcept
{
    const auto elapsed = std::chrono::steady_clock::now() - start;
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count());
}

DecodeErrc to_decode_errc(const std::error_code& code) noexcept
{
    if (code.category() != decode_error_category()) {
        return DecodeErrc::Success;
    }
    return static_cast<DecodeErrc>(code.value());
}

}  // namespace

RowBatchDecoder::RowBatchDecoder()
    : RowBatchDecoder{Config{}}
{}

RowBatchDecoder::RowBatchDecoder(Config config)
    : config_{std::move(config)}
{
    register_telemetry();
}

RowBatchDecoder::~RowBatchDecoder()
{
    unregister_telemetry();
}

void RowBatchDecoder::register_telemetry()
{
    if (config_.telemetry_registry == nullptr || config_.telemetry_identifier.empty()) {
        return;
    }
    config_.telemetry_registry->register_sampler(config_.telemetry_identifier,
                                                 [telemetry = telemetry_]() { return telemetry->snapshot(); });
}

void RowBatchDecoder::unregister_telemetry()
{
    if (config_.telemetry_registry == nullptr || config_.telemetry_identifier.empty()) {
        return;
    }
    config_.telemetry_registry->unregister_sampler(config_.telemetry_identifier);
}

std::vector<Value> RowBatchDecoder::decode_rows(const ValueDecoder& decoder, std::span<const RowData> rows)
{
    std::vector<Value> results;
    results.reserve(rows.size());
    for (const auto& row : rows) {
        telemetry_->record_row_attempt();
        const auto start = Clock::now();
        try {
            results.push_back(decoder.decode(row));
        } catch (const DecodeError& error) {
            record_failure(error, start);
            if (config_.failure_policy == DecodeFailurePolicy::Abort) {
                throw;
            }
            continue;
        }
        record_success(start);
    }
    return results;
}

const RowBatchDecoder::Config& RowBatchDecoder::config() const noexcept
{
    return config_;
}

DecodeTelemetrySnapshot RowBatchDecoder::telemetry_snapshot() const noexcept
{
    return telemetry_->snapshot();
}

void RowBatchDecoder::record_success(Clock::time_point start) noexcept
{
    telemetry_->record_row_decoded(elapsed_ns(start));
}

void RowBatchDecoder::record_failure(const DecodeError& error, Clock::time_point start) noexcept
{
    const bool skipped = config_.failure_policy == DecodeFailurePolicy::SkipRow;
    telemetry_->record_row_failure(to_decode_errc(error.code()), skipped, elapsed_ns(start));
}

}  // namespace widerow::decode
