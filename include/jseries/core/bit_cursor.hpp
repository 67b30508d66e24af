#pragma once

#include <span>

#include <cstddef>
#include <cstdint>

#include "types.hpp"

namespace jseries {

namespace detail {

// Mask covering the low `width` bits (width 0..32)
constexpr uint32_t low_bits_mask(unsigned width) noexcept {
    return width >= 32 ? 0xFFFFFFFFU : ((1U << width) - 1U);
}

} // namespace detail

/**
 * @brief Bit cursor writing MSB-first fields into a caller-owned buffer
 *
 * Tracks the current byte index and bit offset. Each field is written
 * most-significant bit first and may start or end anywhere inside a byte;
 * a field that straddles a byte boundary is split across as many bytes as
 * it covers. Bits are OR-ed into the buffer, so the buffer must start out
 * zero-filled for the output to be deterministic.
 *
 * The writer never grows the buffer. Callers size it from the layout
 * (see layout_bytes()) before writing.
 *
 * Example usage:
 * @code
 * std::array<uint8_t, 2> buf{};
 * BitWriter w(buf);
 * w.write(0b101, 3);
 * w.write(0x1FF, 9);   // crosses into buf[1]
 * // buf == {0xBF, 0xF0}
 * @endcode
 */
class BitWriter {
public:
    explicit BitWriter(std::span<uint8_t> buffer) noexcept : buffer_(buffer) {}

    /**
     * Write the low `width` bits of value at the cursor and advance
     * @param value Field value (bits above width are ignored)
     * @param width Field width in bits, 1..32
     * @return false if width is out of range or the field would run past the buffer
     */
    bool write(uint32_t value, unsigned width) noexcept {
        if (width == 0 || width > max_field_width || width > remaining_bits()) {
            return false;
        }

        value &= detail::low_bits_mask(width);
        unsigned remaining = width;
        while (remaining > 0) {
            size_t byte_index = bit_pos_ / 8;
            unsigned bit_offset = static_cast<unsigned>(bit_pos_ % 8);
            unsigned room = 8 - bit_offset;
            unsigned take = remaining < room ? remaining : room;

            uint32_t chunk = (value >> (remaining - take)) & detail::low_bits_mask(take);
            buffer_[byte_index] |= static_cast<uint8_t>(chunk << (room - take));

            remaining -= take;
            bit_pos_ += take;
        }
        return true;
    }

    /// Advance the cursor without writing (leaves zero bits behind)
    bool skip(size_t bits) noexcept {
        if (bits > remaining_bits()) {
            return false;
        }
        bit_pos_ += bits;
        return true;
    }

    size_t bit_position() const noexcept { return bit_pos_; }
    size_t capacity_bits() const noexcept { return buffer_.size() * 8; }
    size_t remaining_bits() const noexcept { return capacity_bits() - bit_pos_; }

    /// Bytes touched so far, including a partially filled last byte
    size_t bytes_used() const noexcept { return (bit_pos_ + 7) / 8; }

private:
    std::span<uint8_t> buffer_;
    size_t bit_pos_{0};
};

/**
 * @brief Bit cursor reading MSB-first fields from a caller-owned buffer
 *
 * Mirror of BitWriter. Reading never mutates the buffer.
 */
class BitReader {
public:
    explicit BitReader(std::span<const uint8_t> buffer) noexcept : buffer_(buffer) {}

    /**
     * Read a `width`-bit unsigned field at the cursor and advance
     * @param width Field width in bits, 1..32
     * @param out Receives the value on success; untouched on failure
     * @return false if width is out of range or the buffer has too few bits left
     */
    bool read(unsigned width, uint32_t& out) noexcept {
        if (width == 0 || width > max_field_width || width > remaining_bits()) {
            return false;
        }

        uint32_t value = 0;
        unsigned remaining = width;
        while (remaining > 0) {
            size_t byte_index = bit_pos_ / 8;
            unsigned bit_offset = static_cast<unsigned>(bit_pos_ % 8);
            unsigned room = 8 - bit_offset;
            unsigned take = remaining < room ? remaining : room;

            uint32_t chunk = (static_cast<uint32_t>(buffer_[byte_index]) >> (room - take)) &
                             detail::low_bits_mask(take);
            // take is at most 8, so the shift below never reaches 32
            value = static_cast<uint32_t>((static_cast<uint64_t>(value) << take) | chunk);

            remaining -= take;
            bit_pos_ += take;
        }
        out = value;
        return true;
    }

    bool skip(size_t bits) noexcept {
        if (bits > remaining_bits()) {
            return false;
        }
        bit_pos_ += bits;
        return true;
    }

    size_t bit_position() const noexcept { return bit_pos_; }
    size_t available_bits() const noexcept { return buffer_.size() * 8; }
    size_t remaining_bits() const noexcept { return available_bits() - bit_pos_; }

private:
    std::span<const uint8_t> buffer_;
    size_t bit_pos_{0};
};

} // namespace jseries
