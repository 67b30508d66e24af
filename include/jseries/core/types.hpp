#pragma once

#include <cstddef>
#include <cstdint>

namespace jseries {

// Message kind tags (first byte of every frame)
namespace kind {
inline constexpr uint8_t air_track = 0x32; // J3.2 air track report
} // namespace kind

// Envelope layout
inline constexpr size_t kind_tag_bytes = 1;
inline constexpr size_t kind_tag_bits = 8;

// Bit packer limits
inline constexpr unsigned max_field_width = 32;

// Error categories reported by the codec
enum class CodecError : uint8_t {
    none = 0,              // No error
    short_buffer,          // Buffer holds fewer bits than the layout requires
    unsupported_kind,      // Kind tag not registered with any body codec
    quantization_overflow, // Physical value does not fit its target field
};

// Convert codec error to human-readable string
constexpr const char* codec_error_string(CodecError err) noexcept {
    switch (err) {
        case CodecError::none:
            return "No error";
        case CodecError::short_buffer:
            return "Buffer smaller than declared field layout";
        case CodecError::unsupported_kind:
            return "Message kind not registered with any codec";
        case CodecError::quantization_overflow:
            return "Value does not fit its target field width";
        default:
            return "Unknown error";
    }
}

} // namespace jseries
