#include "test_helpers.hpp"
#include "dumper.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>

namespace {

Assembler::Result assemble(const std::string& source) {
    Assembler assembler;
    return assembler.assemble(source);
}

std::string first_error(const std::string& source) {
    Assembler::Result res = assemble(source);
    EXPECT_FALSE(res.success);
    return res.errors.empty() ? "" : res.errors[0];
}

} // namespace

// =============================================================================
// Layout
// =============================================================================

TEST(Dumper, LabelAddresses) {
    auto res = assemble(".org 0x1000\nstart: nop\nmid: .byte 1\n.align\nend:\n");
    ASSERT_TRUE(res.success);
    EXPECT_EQ(res.origin, 0x1000u);
    EXPECT_EQ(res.symbols["start"], 0x1000u);
    EXPECT_EQ(res.symbols["mid"], 0x1004u);
    EXPECT_EQ(res.symbols["end"], 0x1008u);
    EXPECT_EQ(res.bytes.size(), 8u);
}

TEST(Dumper, AlignFill) {
    auto res = assemble(".byte 1\n.align 4, 0xEE\n.byte 2\n.align 2\n");
    ASSERT_TRUE(res.success);
    std::vector<Byte> expected = {0x01, 0xEE, 0xEE, 0xEE, 0x02, 0x00};
    EXPECT_EQ(res.bytes, expected);
}

TEST(Dumper, SkipFill) {
    auto res = assemble(".byte 1\n.skip 2\n.byte 3\n.skip 2, 0x55\n");
    ASSERT_TRUE(res.success);
    std::vector<Byte> expected = {0x01, 0x00, 0x00, 0x03, 0x55, 0x55};
    EXPECT_EQ(res.bytes, expected);
}

TEST(Dumper, BigEndianData) {
    auto res = assemble(".halfword 0x1234, -2\n.word 0xDEADBEEF\n");
    ASSERT_TRUE(res.success);
    std::vector<Byte> expected = {0x12, 0x34, 0xFF, 0xFE, 0xDE, 0xAD, 0xBE, 0xEF};
    EXPECT_EQ(res.bytes, expected);
}

TEST(Dumper, LaterWriteWins) {
    auto res = assemble(".org 0x10\n.byte 1\n.org 0x10\n.byte 2\n");
    ASSERT_TRUE(res.success);
    EXPECT_EQ(res.origin, 0x10u);
    EXPECT_EQ(res.bytes, std::vector<Byte>({2}));
}

TEST(Dumper, GapsAreZeroFilled) {
    auto res = assemble(".org 0x20\n.byte 1\n.org 0x24\n.byte 2\n");
    ASSERT_TRUE(res.success);
    EXPECT_EQ(res.bytes, std::vector<Byte>({1, 0, 0, 0, 2}));
}

TEST(Dumper, LargeSkip) {
    auto res = assemble(".byte 1\n.skip 0x600000, 0xAB\n.byte 2\n");
    ASSERT_TRUE(res.success);
    ASSERT_EQ(res.bytes.size(), 0x600002u);
    EXPECT_EQ(res.bytes[0], 1);
    EXPECT_EQ(res.bytes[0x300000], 0xAB);
    EXPECT_EQ(res.bytes.back(), 2);
}

// =============================================================================
// Encoding
// =============================================================================

TEST(Dumper, BranchOffsets) {
    auto fwd = assemble("b next\nnop\nnext:\n");
    ASSERT_TRUE(fwd.success);
    EXPECT_EQ(word_at(fwd, 0), 0x10000001u);

    auto back = assemble("loop: nop\nb loop\n");
    ASSERT_TRUE(back.success);
    EXPECT_EQ(word_at(back, 1), 0x1000FFFEu);
}

TEST(Dumper, JumpIndex) {
    auto res = assemble(".org 0x80000000\nj there\nnop\nnop\nnop\nthere: nop\n");
    ASSERT_TRUE(res.success);
    EXPECT_EQ(res.origin, 0x80000000u);
    EXPECT_EQ(word_at(res, 0), 0x08000004u);
}

TEST(Dumper, NegatedImmediate) {
    auto res = assemble("subiu t0, t1, 4\n");
    ASSERT_TRUE(res.success);
    EXPECT_EQ(word_at(res, 0), 0x2528FFFCu);
}

TEST(Dumper, ConstantShiftAndFormat) {
    auto res = assemble("sll t0, t1, 4\nadd.d f0, f2, f4\ntlbwi\n");
    ASSERT_TRUE(res.success);
    EXPECT_EQ(word_at(res, 0), 0x00094100u);
    EXPECT_EQ(word_at(res, 1), 0x46241000u);
    EXPECT_EQ(word_at(res, 2), 0x42000002u);
}

TEST(Dumper, WordHoldsLabelAddress) {
    auto res = assemble(".org 0x400\n.word here\nhere: .word here\n");
    ASSERT_TRUE(res.success);
    EXPECT_EQ(word_at(res, 0), 0x404u);
    EXPECT_EQ(word_at(res, 1), 0x404u);
}

// =============================================================================
// Errors
// =============================================================================

TEST(Dumper, DataOutOfRange) {
    EXPECT_EQ(first_error(".byte 256\n"), "(string):1: Error: byte value 256 out of range");
    EXPECT_EQ(first_error("nop\n.byte -129\n"), "(string):2: Error: byte value -129 out of range");
    EXPECT_EQ(first_error(".halfword 0x10000\n"),
              "(string):1: Error: halfword value 65536 out of range");
    EXPECT_EQ(first_error(".word 0x100000000\n"),
              "(string):1: Error: word value 4294967296 out of range");
    EXPECT_TRUE(assemble(".byte -128, 255\n").success);
}

TEST(Dumper, FieldOutOfRange) {
    EXPECT_EQ(first_error("addiu t0, t0, 0x10000\n"),
              "(string):1: Error: value 65536 out of range for 16-bit field");
    EXPECT_EQ(first_error("sll t0, t1, 32\n"),
              "(string):1: Error: value 32 out of range for 5-bit field");
    EXPECT_EQ(first_error("sll t0, t1, -1\n"),
              "(string):1: Error: value -1 out of range for 5-bit field");
}

TEST(Dumper, BranchOutOfRange) {
    EXPECT_EQ(first_error("b far\n.org 0x40000\nfar: nop\n"),
              "(string):1: Error: branch target 'far' out of range");
}

TEST(Dumper, MisalignedJump) {
    EXPECT_EQ(first_error("j 6\n"), "(string):1: Error: jump target 6 is not word aligned");
}

TEST(Dumper, DuplicateLabel) {
    EXPECT_EQ(first_error("a:\nnop\na:\n"), "(string):3: Error: duplicate label 'a'");
}

TEST(Dumper, UndefinedLabel) {
    EXPECT_EQ(first_error("nop\nj nowhere\n"), "(string):2: Error: undefined label 'nowhere'");
}

TEST(Dumper, BadLayout) {
    EXPECT_EQ(first_error(".align -4\n"), "(string):1: Error: alignment must not be negative");
    EXPECT_EQ(first_error(".skip -1\n"), "(string):1: Error: skip size must not be negative");
    EXPECT_EQ(first_error(".org 0xFFFFFFFF\n.halfword 1\n"),
              "(string):2: Error: address out of range");
    EXPECT_EQ(first_error(".byte 1\n.org 0x8000000\n.byte 2\n"),
              "(string):3: Error: output image too large");
    EXPECT_EQ(first_error(".byte 1\n.align 4, 256\n"), "(string):2: Error: fill value out of range");
}

// =============================================================================
// Direct use
// =============================================================================

TEST(Dumper, RequestPositionInErrors) {
    Dumper d;
    d.add_instruction_i("lib.asm", 7, 9, Operand::reg(8), Operand::reg(8), Operand::number(0x10000));
    try {
        d.dump();
        FAIL() << "expected an error";
    } catch (const AsmError& e) {
        EXPECT_EQ(e.file, "lib.asm");
        EXPECT_EQ(e.line, 7);
        EXPECT_EQ(e.message, "value 65536 out of range for 16-bit field");
    }
}

TEST(Dumper, EmptyImage) {
    Dumper d;
    Image img = d.dump();
    EXPECT_EQ(img.origin, 0u);
    EXPECT_TRUE(img.bytes.empty());
    EXPECT_TRUE(img.symbols.empty());
}

TEST(Dumper, DumpOnlyOnce) {
    Dumper d;
    d.add_label("a.asm", 1, "x");
    d.dump();
    EXPECT_THROW(d.dump(), InternalError);
}

TEST(Dumper, OpcodeMustFitSixBits) {
    Dumper d;
    d.add_instruction_j("a.asm", 1, 64, Operand::number(0));
    EXPECT_THROW(d.dump(), InternalError);
}

TEST(Dumper, UnknownDirectiveIsInternal) {
    Dumper d;
    d.add_directive("a.asm", 1, "FLOAT", {Operand::number(1)});
    EXPECT_THROW(d.dump(), InternalError);
}
