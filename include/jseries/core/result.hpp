#pragma once

#include <string>
#include <string_view>
#include <variant>

#include <cstddef>
#include <cstdint>
#include <cstdio>

#include "types.hpp"

namespace jseries {

/**
 * @brief Error result when an encode or decode operation fails
 *
 * Carries the error category plus the context needed to diagnose it.
 * Only the members relevant to the category are meaningful:
 * - short_buffer: needed_bits, available_bits
 * - unsupported_kind: kind
 * - quantization_overflow: field
 */
struct CodecFailure {
    CodecError error{CodecError::none}; ///< The error that occurred
    size_t needed_bits{0};              ///< Bits required by the layout
    size_t available_bits{0};           ///< Bits present in the input buffer
    uint8_t kind{0};                    ///< Offending kind tag
    std::string_view field{};           ///< Name of the field that overflowed

    static constexpr CodecFailure short_buffer(size_t needed, size_t available) noexcept {
        return CodecFailure{CodecError::short_buffer, needed, available, 0, {}};
    }

    static constexpr CodecFailure unsupported_kind(uint8_t tag) noexcept {
        return CodecFailure{CodecError::unsupported_kind, 0, 0, tag, {}};
    }

    static constexpr CodecFailure quantization_overflow(std::string_view name) noexcept {
        return CodecFailure{CodecError::quantization_overflow, 0, 0, 0, name};
    }

    /**
     * @brief Get a human-readable error message
     * @return Description of the failure including its context
     */
    std::string error_message() const {
        std::string msg(codec_error_string(error));
        switch (error) {
            case CodecError::short_buffer:
                msg += ": needed " + std::to_string(needed_bits) + " bits, have " +
                       std::to_string(available_bits);
                break;
            case CodecError::unsupported_kind: {
                char tag[8];
                std::snprintf(tag, sizeof(tag), "0x%02x", static_cast<unsigned>(kind));
                msg += ": ";
                msg += tag;
                break;
            }
            case CodecError::quantization_overflow:
                msg += ": ";
                msg += field;
                break;
            default:
                break;
        }
        return msg;
    }

    bool operator==(const CodecFailure&) const = default;
};

/**
 * @brief Value-or-failure return type used by every codec operation
 *
 * Holds either the produced value or a CodecFailure. Nothing in the codec
 * throws; callers inspect the variant.
 */
template <typename T>
using Result = std::variant<T, CodecFailure>;

/**
 * @brief Check if a result holds a value
 * @param result The result to check
 * @return true if the operation succeeded, false otherwise
 */
template <typename T>
constexpr bool is_ok(const Result<T>& result) noexcept {
    return !std::holds_alternative<CodecFailure>(result);
}

/**
 * @brief Get the failure from a result
 * @param result A result for which is_ok() is false
 * @return The failure description
 */
template <typename T>
constexpr const CodecFailure& failure_of(const Result<T>& result) {
    return std::get<CodecFailure>(result);
}

} // namespace jseries
