#pragma once

#include "widerow/decode/decode_errors.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace widerow::decode {

struct DecodeTelemetrySnapshot final {
    std::uint64_t rows_attempted = 0U;
    std::uint64_t rows_decoded = 0U;
    std::uint64_t rows_skipped = 0U;
    std::uint64_t arity_errors = 0U;
    std::uint64_t null_value_errors = 0U;
    std::uint64_t malformed_value_errors = 0U;
    std::uint64_t configuration_errors = 0U;
    std::uint64_t total_decode_duration_ns = 0U;
    std::uint64_t last_decode_duration_ns = 0U;
};

class DecodeTelemetry final {
public:
    void record_row_attempt() noexcept;
    void record_row_decoded(std::uint64_t decode_duration_ns) noexcept;
    void record_row_failure(DecodeErrc error, bool skipped, std::uint64_t decode_duration_ns) noexcept;

    [[nodiscard]] DecodeTelemetrySnapshot snapshot() const noexcept;
    void reset() noexcept;

private:
    static void add_relaxed(std::atomic<std::uint64_t>& target, std::uint64_t value) noexcept;
    void record_duration(std::uint64_t decode_duration_ns) noexcept;

    std::atomic<std::uint64_t> rows_attempted_{0U};
    std::atomic<std::uint64_t> rows_decoded_{0U};
    std::atomic<std::uint64_t> rows_skipped_{0U};
    std::atomic<std::uint64_t> arity_errors_{0U};
    std::atomic<std::uint64_t> null_value_errors_{0U};
    std::atomic<std::uint64_t> malformed_value_errors_{0U};
    std::atomic<std::uint64_t> configuration_errors_{0U};
    std::atomic<std::uint64_t> total_decode_duration_ns_{0U};
    std::atomic<std::uint64_t> last_decode_duration_ns_{0U};
};

class DecodeTelemetryRegistry final {
public:
    using Sampler = std::function<DecodeTelemetrySnapshot()>;
    using Visitor = std::function<void(const std::string&, const DecodeTelemetrySnapshot&)>;

    void register_sampler(std::string identifier, Sampler sampler);
    void unregister_sampler(const std::string& identifier);

    [[nodiscard]] DecodeTelemetrySnapshot aggregate() const;
    void visit(const Visitor& visitor) const;

private:
    mutable std::mutex mutex_{};
    std::unordered_map<std::string, Sampler> samplers_{};
};

}  // namespace widerow::decode
