#include "test_helpers.hpp"
#include "errors.hpp"
#include "lexer.hpp"
#include "parser.hpp"

#include <gtest/gtest.h>

namespace {

void expect_reg(const Operand& op, int n) {
    EXPECT_EQ(op.kind, OperandKind::REGISTER);
    EXPECT_EQ(op.value, n);
}

void expect_num(const Operand& op, Value v, Modifier m = Modifier::NONE) {
    EXPECT_EQ(op.kind, OperandKind::NUMBER);
    EXPECT_EQ(op.value, v);
    EXPECT_EQ(op.modifier, m);
}

} // namespace

// =============================================================================
// Format engine
// =============================================================================

TEST(Parser, RegisterFormatPlacesOperands) {
    RecordingEmitter em;
    parse_text(em, "addu t0, t1, t2\n");
    ASSERT_EQ(em.requests.size(), 1u);

    const Request& r = em.requests[0];
    EXPECT_EQ(r.kind, Request::Kind::R);
    EXPECT_EQ(r.file, "test.asm");
    EXPECT_EQ(r.line, 1);
    EXPECT_EQ(r.first, 0u);
    ASSERT_EQ(r.args.size(), 5u);
    expect_reg(r.args[0], 9);
    expect_reg(r.args[1], 10);
    expect_reg(r.args[2], 8);
    expect_num(r.args[3], 0);
    expect_num(r.args[4], 33);
    EXPECT_EQ(em.dumps, 1);
}

TEST(Parser, SeparatorsAreOptional) {
    RecordingEmitter em;
    parse_text(em, "addu t0 t1 t2\n");
    auto ins = em.instructions();
    ASSERT_EQ(ins.size(), 1u);
    expect_reg(ins[0].args[2], 8);
}

TEST(Parser, ImmediateFormat) {
    RecordingEmitter em;
    parse_text(em, "addiu t0, t1, -4\nsubiu t0, t1, 4\n");
    auto ins = em.instructions();
    ASSERT_EQ(ins.size(), 2u);
    EXPECT_EQ(ins[0].kind, Request::Kind::I);
    EXPECT_EQ(ins[0].first, 9u);
    expect_reg(ins[0].args[0], 9);
    expect_reg(ins[0].args[1], 8);
    expect_num(ins[0].args[2], -4, Modifier::SIGNED);
    expect_num(ins[1].args[2], 4, Modifier::NEGATE);
    EXPECT_EQ(ins[1].line, 2);
}

TEST(Parser, FloatingPointFormat) {
    RecordingEmitter em;
    parse_text(em, "add.s f2, f4, f6\n");
    auto ins = em.instructions();
    ASSERT_EQ(ins.size(), 1u);
    EXPECT_EQ(ins[0].first, 17u);
    expect_num(ins[0].args[0], 16);
    expect_reg(ins[0].args[1], 6);
    expect_reg(ins[0].args[2], 4);
    expect_reg(ins[0].args[3], 2);
    expect_num(ins[0].args[4], 0);
}

TEST(Parser, SystemRegisterFormat) {
    RecordingEmitter em;
    parse_text(em, "mtc0 t0, status\n");
    auto ins = em.instructions();
    ASSERT_EQ(ins.size(), 1u);
    EXPECT_EQ(ins[0].first, 16u);
    expect_num(ins[0].args[0], 4);
    expect_reg(ins[0].args[1], 8);
    expect_reg(ins[0].args[2], 12);
}

TEST(Parser, JumpAndBranchOperands) {
    RecordingEmitter em;
    parse_text(em, "j target\nbeq t0, t1, target\ntarget:\n");
    auto ins = em.instructions();
    ASSERT_EQ(ins.size(), 2u);

    EXPECT_EQ(ins[0].kind, Request::Kind::J);
    EXPECT_EQ(ins[0].args[0].kind, OperandKind::LABEL);
    EXPECT_EQ(ins[0].args[0].label, "target");
    EXPECT_EQ(ins[0].args[0].modifier, Modifier::INDEX);

    EXPECT_EQ(ins[1].first, 4u);
    EXPECT_EQ(ins[1].args[2].kind, OperandKind::LABEL_REL);
    EXPECT_EQ(ins[1].args[2].modifier, Modifier::SIGNED);

    ASSERT_EQ(em.requests.size(), 3u);
    EXPECT_EQ(em.requests[2].kind, Request::Kind::LABEL);
    EXPECT_EQ(em.requests[2].name, "target");
    EXPECT_EQ(em.requests[2].line, 3);
}

TEST(Parser, DefinesAreSubstituted) {
    RecordingEmitter em;
    parse_text(em, "[step]: 5\naddiu t0, t0, @step\n");
    auto ins = em.instructions();
    ASSERT_EQ(ins.size(), 1u);
    expect_num(ins[0].args[2], 5, Modifier::SIGNED);
}

TEST(Parser, RelativeLabels) {
    RecordingEmitter em;
    parse_text(em, "-:\nb -\nb +\n+:\n");
    ASSERT_EQ(em.requests.size(), 4u);

    EXPECT_EQ(em.requests[0].kind, Request::Kind::LABEL);
    EXPECT_EQ(em.requests[0].name, "0");

    const Request& back = em.requests[1];
    EXPECT_EQ(back.first, 4u);
    expect_num(back.args[0], 0);
    expect_num(back.args[1], 0);
    EXPECT_EQ(back.args[2].kind, OperandKind::LABEL_REL);
    EXPECT_EQ(back.args[2].label, "0");

    EXPECT_EQ(em.requests[2].args[2].label, "8");
    EXPECT_EQ(em.requests[3].kind, Request::Kind::LABEL);
    EXPECT_EQ(em.requests[3].name, "8");
}

// =============================================================================
// Errors
// =============================================================================

TEST(Parser, WrongRegisterClass) {
    EXPECT_EQ(parse_error("add.s f0, t1, f2\n"), "test.asm:1: Error: wrong type of register");
    EXPECT_EQ(parse_error("mfc0 t0, f2\n"), "test.asm:1: Error: wrong type of register");
}

TEST(Parser, ExpectedRegister) {
    EXPECT_EQ(parse_error("addu t0, 5, t2\n"), "test.asm:1: Error: expected register");
    EXPECT_EQ(parse_error("nop\nnop\naddu t0, t1\n"), "test.asm:3: Error: expected register");
}

TEST(Parser, LabelsRejectedForImmediates) {
    EXPECT_EQ(parse_error("ori t0, t1, mask\n"), "test.asm:1: Error: labels are not allowed here");
    EXPECT_EQ(parse_error("ori t0, t1, t2\n"), "test.asm:1: Error: expected constant");
}

TEST(Parser, UnknownInstruction) {
    EXPECT_EQ(parse_error("frob t0\n"),
              "test.asm:1: Error: unexpected token (unknown instruction?)");
}

TEST(Parser, UnimplementedInstruction) {
    EXPECT_EQ(parse_error("\nldl t0, 0(t1)\n"), "test.asm:2: Error: unimplemented instruction");
}

TEST(Parser, TrailingOperand) {
    EXPECT_EQ(parse_error("jr ra ra\n"), "test.asm:1: Error: expected end of line");
}

TEST(Parser, NoDumpAfterError) {
    RecordingEmitter em;
    EXPECT_THROW(parse_text(em, "nop\naddu t0\n"), AsmError);
    EXPECT_EQ(em.dumps, 0);
}

TEST(Parser, UndefinedMnemonicIsInternal) {
    RecordingEmitter em;
    Parser parser(em, "main.asm");
    TokenList tokens({tok(TokenType::INSTR, "ZAP"), tok(TokenType::EOL), eof()});
    try {
        parser.parse(tokens);
        FAIL() << "expected an error";
    } catch (const InternalError& e) {
        EXPECT_EQ(std::string(e.what()), "Internal Error: undefined instruction ZAP");
    }
}

// =============================================================================
// Custom tables and overrides
// =============================================================================

TEST(Parser, CustomTableRoutesShapes) {
    std::vector<InstructionTable::Entry> entries = {
        {"JMP", 2, "I", "I", 0, 0},
        {"LD3", 7, "ti", "0ti", 0, 0},
        {"OP5", 0, "dst", "std0C", 5, 0},
    };
    InstructionTable table(entries);
    Overrides none;

    RecordingEmitter em;
    Parser parser(em, "main.asm", table, none);
    TokenList tokens({
        tok(TokenType::INSTR, "JMP"), tok(TokenType::LABELSYM, "there"), tok(TokenType::EOL),
        tok(TokenType::LABEL, "there", 0, 2), tok(TokenType::INSTR, "LD3", 0, 2),
        tok(TokenType::REG, "T3", 0, 2), num(12, 2), tok(TokenType::EOL, "", 0, 2),
        tok(TokenType::INSTR, "OP5", 0, 3), tok(TokenType::REG, "T0", 0, 3),
        tok(TokenType::REG, "T1", 0, 3), tok(TokenType::REG, "T2", 0, 3), eof("main.asm", 3)
    });
    parser.parse(tokens);

    ASSERT_EQ(em.requests.size(), 4u);
    EXPECT_EQ(em.requests[0].kind, Request::Kind::J);
    EXPECT_EQ(em.requests[0].first, 2u);
    EXPECT_EQ(em.requests[1].kind, Request::Kind::LABEL);
    EXPECT_EQ(em.requests[2].kind, Request::Kind::I);
    EXPECT_EQ(em.requests[2].first, 7u);
    expect_reg(em.requests[2].args[1], 11);
    expect_num(em.requests[2].args[2], 12);
    EXPECT_EQ(em.requests[3].kind, Request::Kind::R);
    EXPECT_EQ(em.requests[3].line, 3);
    expect_num(em.requests[3].args[4], 5);
    EXPECT_EQ(em.dumps, 1);
}

TEST(Parser, TableFormatUsedWithoutOverride) {
    Overrides none;
    RecordingEmitter em;
    Parser parser(em, "test.asm", InstructionTable::mips(), none);
    Lexer lexer("li t0, 7\n", "test.asm");
    parser.parse(lexer);

    auto ins = em.instructions();
    ASSERT_EQ(ins.size(), 1u);
    EXPECT_EQ(ins[0].first, 9u);
    expect_num(ins[0].args[0], 0);
    expect_reg(ins[0].args[1], 8);
    expect_num(ins[0].args[2], 7, Modifier::SIGNED);
}

TEST(Parser, IncludedEndOfFileIsSkipped) {
    RecordingEmitter em;
    Parser parser(em, "main.asm");
    TokenList tokens({
        tok(TokenType::INSTR, "NOP", 0, 1, "inc.asm"), eof("inc.asm"),
        tok(TokenType::EOL), tok(TokenType::INSTR, "NOP", 0, 2), eof("main.asm", 2)
    });
    parser.parse(tokens);

    auto ins = em.instructions();
    ASSERT_EQ(ins.size(), 2u);
    EXPECT_EQ(ins[0].file, "inc.asm");
    EXPECT_EQ(ins[1].file, "main.asm");
}
