#include "memory.hpp"

#include <gtest/gtest.h>

TEST(Memory, Empty) {
    Memory m;
    EXPECT_TRUE(m.empty());
    EXPECT_TRUE(m.flatten().empty());
    EXPECT_EQ(m.lowest(), 0u);
}

TEST(Memory, BigEndianWrites) {
    Memory m;
    m.write_word(0x100, 0x11223344);
    m.write_half(0x104, 0x5566);
    m.write_byte(0x106, 0x77);
    EXPECT_EQ(m.lowest(), 0x100u);
    EXPECT_EQ(m.highest(), 0x106u);
    EXPECT_EQ(m.flatten(), std::vector<Byte>({0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77}));
}

TEST(Memory, GapsBetweenRunsAreZero) {
    Memory m;
    m.write_byte(0x13, 3);
    m.write_byte(0x10, 1);
    EXPECT_EQ(m.flatten(), std::vector<Byte>({1, 0, 0, 3}));
}

TEST(Memory, OverlappingWritesKeepLatest) {
    Memory m;
    m.write_word(0x20, 0xAAAAAAAA);
    m.write_word(0x28, 0xBBBBBBBB);
    // Starts before the first run, covers it, and ends where the second begins
    m.fill(0x1E, 10, 0xCC);
    EXPECT_EQ(m.lowest(), 0x1Eu);
    EXPECT_EQ(m.highest(), 0x2Bu);
    std::vector<Byte> expected(10, 0xCC);
    expected.insert(expected.end(), 4, 0xBB);
    EXPECT_EQ(m.flatten(), expected);

    m.write_half(0x21, 0x1234);
    EXPECT_EQ(m.flatten()[3], 0x12);
    EXPECT_EQ(m.flatten()[4], 0x34);
}

TEST(Memory, TopOfAddressSpace) {
    Memory m;
    m.write_word(0xFFFFFFFC, 0x01020304);
    EXPECT_EQ(m.highest(), 0xFFFFFFFFu);
    EXPECT_EQ(m.flatten(), std::vector<Byte>({1, 2, 3, 4}));
}

TEST(Memory, LargeFill) {
    const size_t size = 16 * 1024 * 1024;
    Memory m;
    m.write_byte(0, 1);
    m.fill(1, size, 0xEE);
    m.write_byte(static_cast<Address>(size + 1), 2);

    std::vector<Byte> out = m.flatten();
    ASSERT_EQ(out.size(), size + 2);
    EXPECT_EQ(out.front(), 1);
    EXPECT_EQ(out[size / 2], 0xEE);
    EXPECT_EQ(out.back(), 2);
}
