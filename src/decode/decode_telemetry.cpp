#include "widerow/decode/decode_telemetry.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace widerow::decode {
namespace {

DecodeTelemetrySnapshot& accumulate(DecodeTelemetrySnapshot& target, const DecodeTelemetrySnapshot& source)
{
    target.rows_attempted += source.rows_attempted;
    target.rows_decoded += source.rows_decoded;
    target.rows_skipped += source.rows_skipped;
    target.arity_errors += source.arity_errors;
    target.null_value_errors += source.null_value_errors;
    target.malformed_value_errors += source.malformed_value_errors;
    target.configuration_errors += source.configuration_errors;
    target.total_decode_duration_ns += source.total_decode_duration_ns;
    target.last_decode_duration_ns = std::max(target.last_decode_duration_ns, source.last_decode_duration_ns);
    return target;
}

}  // namespace

void DecodeTelemetry::add_relaxed(std::atomic<std::uint64_t>& target, std::uint64_t value) noexcept
{
    target.fetch_add(value, std::memory_order_relaxed);
}

void DecodeTelemetry::record_duration(std::uint64_t decode_duration_ns) noexcept
{
    add_relaxed(total_decode_duration_ns_, decode_duration_ns);
    last_decode_duration_ns_.store(decode_duration_ns, std::memory_order_relaxed);
}

void DecodeTelemetry::record_row_attempt() noexcept
{
    add_relaxed(rows_attempted_, 1U);
}

void DecodeTelemetry::record_row_decoded(std::uint64_t decode_duration_ns) noexcept
{
    add_relaxed(rows_decoded_, 1U);
    record_duration(decode_duration_ns);
}

void DecodeTelemetry::record_row_failure(DecodeErrc error, bool skipped, std::uint64_t decode_duration_ns) noexcept
{
    switch (error) {
    case DecodeErrc::ArityMismatch:
        add_relaxed(arity_errors_, 1U);
        break;
    case DecodeErrc::NullValue:
        add_relaxed(null_value_errors_, 1U);
        break;
    case DecodeErrc::MalformedValue:
        add_relaxed(malformed_value_errors_, 1U);
        break;
    case DecodeErrc::InvalidConfiguration:
        add_relaxed(configuration_errors_, 1U);
        break;
    case DecodeErrc::Success:
    default:
        break;
    }

    if (skipped) {
        add_relaxed(rows_skipped_, 1U);
    }
    record_duration(decode_duration_ns);
}

DecodeTelemetrySnapshot DecodeTelemetry::snapshot() const noexcept
{
    DecodeTelemetrySnapshot snapshot{};
    snapshot.rows_attempted = rows_attempted_.load(std::memory_order_relaxed);
    snapshot.rows_decoded = rows_decoded_.load(std::memory_order_relaxed);
    snapshot.rows_skipped = rows_skipped_.load(std::memory_order_relaxed);
    snapshot.arity_errors = arity_errors_.load(std::memory_order_relaxed);
    snapshot.null_value_errors = null_value_errors_.load(std::memory_order_relaxed);
    snapshot.malformed_value_errors = malformed_value_errors_.load(std::memory_order_relaxed);
    snapshot.configuration_errors = configuration_errors_.load(std::memory_order_relaxed);
    snapshot.total_decode_duration_ns = total_decode_duration_ns_.load(std::memory_order_relaxed);
    snapshot.last_decode_duration_ns = last_decode_duration_ns_.load(std::memory_order_relaxed);
    return snapshot;
}

void DecodeTelemetry::reset() noexcept
{
    rows_attempted_.store(0U, std::memory_order_relaxed);
    rows_decoded_.store(0U, std::memory_order_relaxed);
    rows_skipped_.store(0U, std::memory_order_relaxed);
    arity_errors_.store(0U, std::memory_order_relaxed);
    null_value_errors_.store(0U, std::memory_order_relaxed);
    malformed_value_errors_.store(0U, std::memory_order_relaxed);
    configuration_errors_.store(0U, std::memory_order_relaxed);
    total_decode_duration_ns_.store(0U, std::memory_order_relaxed);
    last_decode_duration_ns_.store(0U, std::memory_order_relaxed);
}

void DecodeTelemetryRegistry::register_sampler(std::string identifier, Sampler sampler)
{
    if (!sampler) {
        return;
    }

    std::lock_guard guard(mutex_);
    samplers_.insert_or_assign(std::move(identifier), std::move(sampler));
}

void DecodeTelemetryRegistry::unregister_sampler(const std::string& identifier)
{
    std::lock_guard guard(mutex_);
    samplers_.erase(identifier);
}

DecodeTelemetrySnapshot DecodeTelemetryRegistry::aggregate() const
{
    std::vector<Sampler> samplers;
    {
        std::lock_guard guard(mutex_);
        samplers.reserve(samplers_.size());
        for (const auto& [_, sampler] : samplers_) {
            samplers.push_back(sampler);
        }
    }

    DecodeTelemetrySnapshot total{};
    for (const auto& sampler : samplers) {
        if (!sampler) {
            continue;
        }
        accumulate(total, sampler());
    }
    return total;
}

void DecodeTelemetryRegistry::visit(const Visitor& visitor) const
{
    if (!visitor) {
        return;
    }

    std::vector<std::pair<std::string, Sampler>> entries;
    {
        std::lock_guard guard(mutex_);
        entries.reserve(samplers_.size());
        for (const auto& [identifier, sampler] : samplers_) {
            entries.emplace_back(identifier, sampler);
        }
    }

    for (const auto& [identifier, sampler] : entries) {
        if (!sampler) {
            continue;
        }
        visitor(identifier, sampler());
    }
}

}  // namespace widerow::decode
