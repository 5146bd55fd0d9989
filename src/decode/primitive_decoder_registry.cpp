#include "widerow/decode/primitive_decoder_registry.hpp"

#include "widerow/decode/column_codec.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <utility>

namespace widerow::decode {
namespace {

template <typename T>
Value decode_builtin(std::span<const std::byte> bytes)
{
    return Value{ColumnCodec<T>::decode(bytes)};
}

template <typename T>
PrimitiveDecoderEntry make_builtin_entry()
{
    PrimitiveDecoderEntry entry{};
    entry.name = ColumnCodec<T>::type_name;
    entry.decode = decode_builtin<T>;
    entry.fixed_width = ColumnCodec<T>::fixed_width;
    return entry;
}

}  // namespace

PrimitiveDecoderRegistry::PrimitiveDecoderRegistry()
{
    register_builtins();
}

PrimitiveDecoderRegistry& PrimitiveDecoderRegistry::instance() noexcept
{
    static PrimitiveDecoderRegistry registry;
    return registry;
}

bool PrimitiveDecoderRegistry::register_decoder(PrimitiveDecoderEntry entry)
{
    if (entry.name.empty() || entry.decode == nullptr) {
        return false;
    }

    std::scoped_lock lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const PrimitiveDecoderEntry& existing) {
        return existing.name == entry.name;
    });
    if (it != entries_.end()) {
        return false;
    }
    entries_.push_back(std::move(entry));
    return true;
}

const PrimitiveDecoderEntry* PrimitiveDecoderRegistry::find(std::string_view name) const noexcept
{
    std::scoped_lock lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const PrimitiveDecoderEntry& entry) {
        return entry.name == name;
    });
    if (it == entries_.end()) {
        return nullptr;
    }
    return &(*it);
}

std::vector<std::string> PrimitiveDecoderRegistry::names() const
{
    std::scoped_lock lock(mutex_);
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

bool PrimitiveDecoderRegistry::register_builtins()
{
    std::scoped_lock lock(mutex_);
    if (builtins_registered_) {
        return true;
    }

    const std::array<PrimitiveDecoderEntry, 8> builtins{
        make_builtin_entry<bool>(),
        make_builtin_entry<std::int16_t>(),
        make_builtin_entry<std::int32_t>(),
        make_builtin_entry<std::int64_t>(),
        make_builtin_entry<float>(),
        make_builtin_entry<double>(),
        make_builtin_entry<Decimal>(),
        make_builtin_entry<std::string>()
    };

    for (const auto& entry : builtins) {
        auto duplicate = std::find_if(entries_.begin(), entries_.end(), [&](const PrimitiveDecoderEntry& existing) {
            return existing.name == entry.name;
        });
        if (duplicate == entries_.end()) {
            entries_.push_back(entry);
        }
    }

    builtins_registered_ = true;
    return true;
}

bool register_primitive_decoder(PrimitiveDecoderEntry entry)
{
    return PrimitiveDecoderRegistry::instance().register_decoder(std::move(entry));
}

const PrimitiveDecoderEntry* find_primitive_decoder(std::string_view name) noexcept
{
    return PrimitiveDecoderRegistry::instance().find(name);
}

std::vector<std::string> primitive_decoder_names()
{
    return PrimitiveDecoderRegistry::instance().names();
}

}  // namespace widerow::decode
