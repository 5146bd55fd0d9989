#pragma once

#include "widerow/decode/value.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace widerow::decode {

struct PrimitiveDecoderEntry final {
    using DecodeFn = Value (*)(std::span<const std::byte>);

    std::string name{};
    DecodeFn decode = nullptr;
    std::size_t fixed_width = 0U;  // zero indicates variable width
};

// Named primitive decoders for the runtime decoder layer, keyed by type tag.
class PrimitiveDecoderRegistry final {
public:
    PrimitiveDecoderRegistry();

    PrimitiveDecoderRegistry(const PrimitiveDecoderRegistry&) = delete;
    PrimitiveDecoderRegistry& operator=(const PrimitiveDecoderRegistry&) = delete;
    PrimitiveDecoderRegistry(PrimitiveDecoderRegistry&&) = delete;
    PrimitiveDecoderRegistry& operator=(PrimitiveDecoderRegistry&&) = delete;

    static PrimitiveDecoderRegistry& instance() noexcept;

    bool register_decoder(PrimitiveDecoderEntry entry);

    [[nodiscard]] const PrimitiveDecoderEntry* find(std::string_view name) const noexcept;
    [[nodiscard]] std::vector<std::string> names() const;

private:
    bool register_builtins();

    mutable std::mutex mutex_;
    std::deque<PrimitiveDecoderEntry> entries_{};
    bool builtins_registered_ = false;
};

bool register_primitive_decoder(PrimitiveDecoderEntry entry);
[[nodiscard]] const PrimitiveDecoderEntry* find_primitive_decoder(std::string_view name) noexcept;
[[nodiscard]] std::vector<std::string> primitive_decoder_names();

}  // namespace widerow::decode
