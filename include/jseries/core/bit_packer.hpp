#pragma once

#include <span>
#include <string_view>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "bit_cursor.hpp"
#include "result.hpp"

namespace jseries {

// Field signedness in a layout table
enum class Signedness : uint8_t {
    unsigned_field = 0, // Raw code is the value
    signed_field = 1    // Raw code is two's complement over the field width
};

/**
 * @brief One entry of a message field table
 *
 * A message body layout is an ordered array of FieldSpec. The order of the
 * array is the order of the fields on the wire.
 *
 * signedness describes how to read the raw code; pack and unpack always move
 * raw codes. Callers convert signed fields with sign_extend().
 */
struct FieldSpec {
    std::string_view name;
    uint8_t width; ///< Bits, 1..32
    Signedness signedness{Signedness::unsigned_field};
};

/// A value paired with the width it occupies on the wire
struct FieldValue {
    uint32_t value;
    uint8_t width; ///< Bits, 1..32
};

/// Total bits declared by a layout
constexpr size_t layout_bits(std::span<const FieldSpec> layout) noexcept {
    size_t bits = 0;
    for (const auto& field : layout) {
        bits += field.width;
    }
    return bits;
}

/// Bytes needed to hold a layout, last byte zero-padded
constexpr size_t layout_bytes(std::span<const FieldSpec> layout) noexcept {
    return (layout_bits(layout) + 7) / 8;
}

/// Largest raw code a field of the given width can hold
constexpr uint32_t field_max(unsigned width) noexcept {
    return detail::low_bits_mask(width);
}

/// Check a layout for widths outside 1..32
constexpr bool is_valid_layout(std::span<const FieldSpec> layout) noexcept {
    for (const auto& field : layout) {
        if (field.width == 0 || field.width > max_field_width) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Interpret a raw code as a two's complement value of the given width
 * @param raw Raw code as returned by unpack()
 * @param width Field width in bits, 1..32
 * @return Sign-extended value
 */
constexpr int32_t sign_extend(uint32_t raw, unsigned width) noexcept {
    if (width == 0 || width >= 32) {
        return static_cast<int32_t>(raw);
    }
    uint32_t sign_bit = 1U << (width - 1);
    raw &= detail::low_bits_mask(width);
    return static_cast<int32_t>(raw ^ sign_bit) - static_cast<int32_t>(sign_bit);
}

/**
 * @brief Pack an ordered list of fields into a new byte buffer
 *
 * Fields are written MSB-first in list order with no gaps. The returned
 * buffer is exactly (total_bits + 7) / 8 bytes and the unused tail of the
 * last byte is zero. Only the low `width` bits of each value are written;
 * callers are expected to have range-checked values beforehand.
 *
 * Entries with a width outside 1..32 are skipped.
 *
 * @param fields Values and widths in wire order
 * @return Packed bytes
 */
inline std::vector<uint8_t> pack(std::span<const FieldValue> fields) {
    size_t total_bits = 0;
    for (const auto& f : fields) {
        if (f.width > 0 && f.width <= max_field_width) {
            total_bits += f.width;
        }
    }

    std::vector<uint8_t> out((total_bits + 7) / 8, 0);
    BitWriter writer(out);
    for (const auto& f : fields) {
        // Cannot fail: the buffer was sized from the same widths
        (void)writer.write(f.value, f.width);
    }
    return out;
}

/**
 * @brief Pack values against a field table
 *
 * The output always covers the whole layout. Fields with no matching entry
 * in values (values shorter than layout) are left as zero bits; values past
 * the end of the layout are ignored.
 *
 * @param layout Field table in wire order
 * @param values One value per layout entry, same order
 * @return Packed bytes (layout_bytes(layout) long)
 */
inline std::vector<uint8_t> pack(std::span<const FieldSpec> layout,
                                 std::span<const uint32_t> values) {
    std::vector<uint8_t> out(layout_bytes(layout), 0);
    BitWriter writer(out);
    size_t count = layout.size() < values.size() ? layout.size() : values.size();
    for (size_t i = 0; i < count; ++i) {
        if (!writer.write(values[i], layout[i].width)) {
            (void)writer.skip(layout[i].width);
        }
    }
    return out;
}

/**
 * @brief Read fields of the given widths from a buffer
 *
 * Reads exactly the declared number of bits starting at bit 0. Bits and
 * bytes past the end of the layout are ignored.
 *
 * @param buffer Input bytes (not modified)
 * @param widths Field widths in wire order, each 1..32
 * @return Raw field codes, or ShortBuffer(needed_bits, available_bits)
 */
inline Result<std::vector<uint32_t>> unpack(std::span<const uint8_t> buffer,
                                            std::span<const uint8_t> widths) {
    size_t needed = 0;
    for (auto w : widths) {
        needed += w;
    }
    size_t available = buffer.size() * 8;
    if (available < needed) {
        return CodecFailure::short_buffer(needed, available);
    }

    std::vector<uint32_t> values;
    values.reserve(widths.size());
    BitReader reader(buffer);
    for (auto w : widths) {
        uint32_t v = 0;
        if (!reader.read(w, v)) {
            // Only reachable with a width outside 1..32
            return CodecFailure::short_buffer(needed, available);
        }
        values.push_back(v);
    }
    return values;
}

/**
 * @brief Read the fields of a table from a buffer
 *
 * Codes come back raw regardless of FieldSpec::signedness; apply
 * sign_extend() to signed fields.
 *
 * @param buffer Input bytes (not modified)
 * @param layout Field table in wire order
 * @return Raw field codes in table order, or ShortBuffer(needed_bits, available_bits)
 */
inline Result<std::vector<uint32_t>> unpack(std::span<const uint8_t> buffer,
                                            std::span<const FieldSpec> layout) {
    std::vector<uint8_t> widths;
    widths.reserve(layout.size());
    for (const auto& field : layout) {
        widths.push_back(field.width);
    }
    return unpack(buffer, std::span<const uint8_t>(widths));
}

} // namespace jseries
