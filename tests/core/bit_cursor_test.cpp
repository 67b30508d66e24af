#include <array>

#include <cstdint>
#include <gtest/gtest.h>
#include <jseries/core/bit_cursor.hpp>

using namespace jseries;

// Test 1: Fields that stay inside one byte
TEST(BitCursorTest, WriteWithinSingleByte) {
    std::array<uint8_t, 1> buf{};
    BitWriter w(buf);

    EXPECT_TRUE(w.write(0b1, 1));
    EXPECT_TRUE(w.write(0b01, 2));
    EXPECT_TRUE(w.write(0b10110, 5));

    EXPECT_EQ(buf[0], 0b10110110);
    EXPECT_EQ(w.bit_position(), 8u);
    EXPECT_EQ(w.remaining_bits(), 0u);
}

// Test 2: A field straddling a byte boundary is split MSB-first
TEST(BitCursorTest, WriteCrossesByteBoundary) {
    std::array<uint8_t, 2> buf{};
    BitWriter w(buf);

    EXPECT_TRUE(w.write(0b101, 3));
    EXPECT_TRUE(w.write(0x1FF, 9));

    EXPECT_EQ(buf[0], 0xBF);
    EXPECT_EQ(buf[1], 0xF0);
    EXPECT_EQ(w.bytes_used(), 2u);
}

// Test 3: A 19-bit field starting mid-byte spans four bytes
TEST(BitCursorTest, NineteenBitFieldAtOddOffset) {
    std::array<uint8_t, 4> buf{};
    BitWriter w(buf);

    EXPECT_TRUE(w.write(0, 5));
    EXPECT_TRUE(w.write(0x7FFFF, 19));

    // Bits 5..23 set
    EXPECT_EQ(buf[0], 0x07);
    EXPECT_EQ(buf[1], 0xFF);
    EXPECT_EQ(buf[2], 0xFF);
    EXPECT_EQ(buf[3], 0x00);
}

// Test 4: Full-width 32-bit fields, aligned and unaligned
TEST(BitCursorTest, ThirtyTwoBitFields) {
    std::array<uint8_t, 9> buf{};
    BitWriter w(buf);

    EXPECT_TRUE(w.write(0xDEADBEEF, 32));
    EXPECT_TRUE(w.write(0, 4));
    EXPECT_TRUE(w.write(0xCAFEBABE, 32));

    EXPECT_EQ(buf[0], 0xDE);
    EXPECT_EQ(buf[1], 0xAD);
    EXPECT_EQ(buf[2], 0xBE);
    EXPECT_EQ(buf[3], 0xEF);
    EXPECT_EQ(buf[4], 0x0C);
    EXPECT_EQ(buf[5], 0xAF);
    EXPECT_EQ(buf[6], 0xEB);
    EXPECT_EQ(buf[7], 0xAB);
    EXPECT_EQ(buf[8], 0xE0);

    BitReader r(buf);
    uint32_t v = 0;
    ASSERT_TRUE(r.read(32, v));
    EXPECT_EQ(v, 0xDEADBEEFu);
    ASSERT_TRUE(r.skip(4));
    ASSERT_TRUE(r.read(32, v));
    EXPECT_EQ(v, 0xCAFEBABEu);
}

// Test 5: Bits above the declared width never leak into neighbours
TEST(BitCursorTest, WriteMasksToWidth) {
    std::array<uint8_t, 1> buf{};
    BitWriter w(buf);

    EXPECT_TRUE(w.write(0xFF, 4));
    EXPECT_EQ(buf[0], 0xF0);
}

// Test 6: Invalid widths and writes past the end are refused
TEST(BitCursorTest, RejectsBadWidthAndOverrun) {
    std::array<uint8_t, 2> buf{};
    BitWriter w(buf);

    EXPECT_FALSE(w.write(1, 0));
    EXPECT_FALSE(w.write(1, 33));
    EXPECT_FALSE(w.write(1, 17));
    EXPECT_EQ(w.bit_position(), 0u);

    EXPECT_TRUE(w.write(0x3FFF, 14));
    EXPECT_FALSE(w.write(0x7, 3));
    EXPECT_EQ(w.bit_position(), 14u);
    EXPECT_EQ(buf[0], 0xFF);
    EXPECT_EQ(buf[1], 0xFC);
}

// Test 7: Reader walks the same layout back
TEST(BitCursorTest, ReadMirrorsWrite) {
    const std::array<uint8_t, 2> buf = {0xBF, 0xF0};
    BitReader r(buf);

    uint32_t a = 0;
    uint32_t b = 0;
    uint32_t c = 0;
    ASSERT_TRUE(r.read(3, a));
    ASSERT_TRUE(r.read(9, b));
    ASSERT_TRUE(r.read(4, c));

    EXPECT_EQ(a, 0b101u);
    EXPECT_EQ(b, 0x1FFu);
    EXPECT_EQ(c, 0u);
    EXPECT_EQ(r.remaining_bits(), 0u);
}

// Test 8: Failed reads leave the output and the cursor untouched
TEST(BitCursorTest, ReadPastEndFails) {
    const std::array<uint8_t, 1> buf = {0xA5};
    BitReader r(buf);

    uint32_t v = 0x1234;
    ASSERT_TRUE(r.read(5, v));
    EXPECT_EQ(v, 0b10100u);

    v = 0x1234;
    EXPECT_FALSE(r.read(4, v));
    EXPECT_EQ(v, 0x1234u);
    EXPECT_EQ(r.bit_position(), 5u);

    EXPECT_FALSE(r.read(0, v));
    EXPECT_FALSE(r.skip(4));
}

// Test 9: Skipped bits stay zero
TEST(BitCursorTest, SkipLeavesZeros) {
    std::array<uint8_t, 2> buf{};
    BitWriter w(buf);

    EXPECT_TRUE(w.write(1, 1));
    EXPECT_TRUE(w.skip(14));
    EXPECT_TRUE(w.write(1, 1));

    EXPECT_EQ(buf[0], 0x80);
    EXPECT_EQ(buf[1], 0x01);
}
