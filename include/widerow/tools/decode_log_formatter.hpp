#pragma once

#include "widerow/decode/decode_telemetry.hpp"
#include "widerow/decode/primitive_decoder_registry.hpp"
#include "widerow/decode/value.hpp"

#include <string>

namespace widerow::tools {

[[nodiscard]] std::string format_decode_log_json(const std::string& identifier,
                                                 const widerow::decode::DecodeTelemetrySnapshot& snapshot);

[[nodiscard]] std::string format_value_json(const widerow::decode::Value& value);

// One line of the type listing: the tag name and its byte width, e.g. "int32 4 bytes" or "string variable".
[[nodiscard]] std::string format_type_listing(const widerow::decode::PrimitiveDecoderEntry& entry);

}  // namespace widerow::tools
