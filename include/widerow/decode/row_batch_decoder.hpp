#pragma once

#include "widerow/decode/decode_errors.hpp"
#include "widerow/decode/decode_telemetry.hpp"
#include "widerow/decode/decoder.hpp"
#include "widerow/decode/row_data.hpp"
#include "widerow/decode/value.hpp"
#include "widerow/decode/value_decoder.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace widerow::decode {

enum class DecodeFailurePolicy : std::uint8_t {
    Abort = 0,
    SkipRow
};

// Decodes scanned rows in order. Abort rethrows the first failure; SkipRow drops failing rows.
class RowBatchDecoder final {
public:
    struct Config final {
        DecodeFailurePolicy failure_policy = DecodeFailurePolicy::Abort;
        DecodeTelemetryRegistry* telemetry_registry = nullptr;
        std::string telemetry_identifier{};
    };

    RowBatchDecoder();
    explicit RowBatchDecoder(Config config);
    ~RowBatchDecoder();

    RowBatchDecoder(const RowBatchDecoder&) = delete;
    RowBatchDecoder& operator=(const RowBatchDecoder&) = delete;
    RowBatchDecoder(RowBatchDecoder&&) = delete;
    RowBatchDecoder& operator=(RowBatchDecoder&&) = delete;

    template <typename T>
    [[nodiscard]] std::vector<T> decode_rows(std::span<const RowData> rows)
    {
        return decode_with(decoder_for_t<T>{}, rows);
    }

    template <typename Decoder>
    [[nodiscard]] std::vector<typename Decoder::value_type> decode_with(const Decoder& decoder,
                                                                        std::span<const RowData> rows)
    {
        std::vector<typename Decoder::value_type> results;
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

    [[nodiscard]] std::vector<Value> decode_rows(const ValueDecoder& decoder, std::span<const RowData> rows);

    [[nodiscard]] const Config& config() const noexcept;
    [[nodiscard]] DecodeTelemetrySnapshot telemetry_snapshot() const noexcept;

private:
    using Clock = std::chrono::steady_clock;

    void register_telemetry();
    void unregister_telemetry();
    void record_success(Clock::time_point start) noexcept;
    void record_failure(const DecodeError& error, Clock::time_point start) noexcept;

    Config config_{};
    // Shared with the registered sampler, which may still run after this decoder is destroyed.
    std::shared_ptr<DecodeTelemetry> telemetry_ = std::make_shared<DecodeTelemetry>();
};

}  // namespace widerow::decode
