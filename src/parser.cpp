/**
 * parser.cpp
 *
 * Parser implementation.
 * Tokens are fully resolved (defines, relative labels) before the first
 * instruction is parsed; labels are left for the emitter.
 */

#include "parser.hpp"
#include "resolver.hpp"

Parser::Parser(Emitter& out, const std::string& main_file,
               const InstructionTable& table, const Overrides& overrides)
    : out(out), main_file(main_file), table(table), overrides(overrides) {}

// =============================================================================
// Cursor
// =============================================================================

const Token& Parser::current() const {
    if (pos >= tokens.size()) {
        throw InternalError("missing token");
    }
    return tokens[pos];
}

void Parser::advance() {
    if (pos + 1 >= tokens.size()) {
        throw InternalError("missing token");
    }
    pos++;
}

// End of file is left for the main loop to see
void Parser::expect_eol() {
    if (type() == TokenType::EOL) {
        advance();
        return;
    }
    if (type() == TokenType::END_OF_FILE) return;
    throw error("expected end of line");
}

bool Parser::optional_comma() {
    if (type() == TokenType::SEP && current().text == ",") {
        advance();
        return true;
    }
    return false;
}

AsmError Parser::error(const std::string& msg) const {
    return AsmError(current().file, current().line, msg);
}

void Parser::mark_statement() {
    stmt_file = current().file;
    stmt_line = current().line;
}

// =============================================================================
// Operands
// =============================================================================

Value Parser::number() {
    if (type() != TokenType::NUM) {
        throw error("expected number");
    }
    Value v = current().number;
    advance();
    return v;
}

std::vector<Byte> Parser::string() {
    if (type() != TokenType::STRING) {
        throw error("expected string");
    }
    std::vector<Byte> bytes = current().bytes;
    advance();
    return bytes;
}

int Parser::reg(RegisterClass cls) {
    if (type() != TokenType::REG) {
        throw error("expected register");
    }
    auto n = Registers::lookup(cls, current().text);
    if (!n) {
        throw error("wrong type of register");
    }
    advance();
    return *n;
}

int Parser::deref() {
    if (type() != TokenType::DEREF) {
        throw error("expected register to dereference");
    }
    auto n = Registers::lookup(RegisterClass::GENERAL, current().text);
    if (!n) {
        throw error("wrong type of register");
    }
    advance();
    return *n;
}

Operand Parser::constant(bool relative, bool no_label) {
    if (type() != TokenType::NUM && type() != TokenType::LABELSYM) {
        throw error("expected constant");
    }
    if (no_label && type() == TokenType::LABELSYM) {
        throw error("labels are not allowed here");
    }

    Operand op = (type() == TokenType::NUM)
        ? Operand::number(current().number)
        : Operand::symbol(current().text, relative);
    advance();
    return op;
}

// =============================================================================
// Directives
// =============================================================================

void Parser::add_directive(const std::string& name, const std::vector<Operand>& args) {
    out.add_directive(stmt_file, stmt_line, name, args);
}

void Parser::directive() {
    mark_statement();
    std::string name = current().text;
    advance();

    if (name == "ORG") {
        add_directive(name, {Operand::number(number())});
        expect_eol();
    } else if (name == "ALIGN" || name == "SKIP") {
        if (is_eol() && name == "ALIGN") {
            add_directive(name, {Operand::number(0)});
        } else {
            Value size = number();
            if (is_eol()) {
                add_directive(name, {Operand::number(size)});
            } else {
                optional_comma();
                Value fill = number();
                add_directive(name, {Operand::number(size), Operand::number(fill)});
            }
        }
        expect_eol();
    } else if (name == "BYTE" || name == "HALFWORD") {
        add_directive(name, {Operand::number(number())});
        while (!is_eol()) {
            optional_comma();
            add_directive(name, {Operand::number(number())});
        }
        expect_eol();
    } else if (name == "WORD") {
        // The only list directive that takes labels
        add_directive(name, {constant()});
        while (!is_eol()) {
            optional_comma();
            add_directive(name, {constant()});
        }
        expect_eol();
    } else if (name == "INC") {
        // Included tokens follow directly; the lexer did the work
    } else if (name == "ASCII" || name == "ASCIIZ") {
        for (Byte b : string()) {
            add_directive("BYTE", {Operand::number(b)});
        }
        if (name == "ASCIIZ") {
            add_directive("BYTE", {Operand::number(0)});
        }
        expect_eol();
    } else if (name == "INCBIN" || name == "FLOAT") {
        throw AsmError(stmt_file, stmt_line, "unimplemented");
    } else {
        throw AsmError(stmt_file, stmt_line, "unknown directive");
    }
}

// =============================================================================
// Format Engine
// =============================================================================

Args Parser::format_in(const InstructionDef& def) {
    Args args;
    for (const auto& step : def.input) {
        Slot slot = InstructionTable::slot_for(step.role);
        switch (step.role) {
            case InRole::GPR_D:
            case InRole::GPR_S:
            case InRole::GPR_T:
                args.set(slot, Operand::reg(reg(RegisterClass::GENERAL)));
                break;
            case InRole::FPR_D:
            case InRole::FPR_S:
            case InRole::FPR_T:
                args.set(slot, Operand::reg(reg(RegisterClass::FPU)));
                break;
            case InRole::SYS_D:
            case InRole::SYS_S:
            case InRole::SYS_T:
                args.set(slot, Operand::reg(reg(RegisterClass::SYSTEM)));
                break;
            case InRole::OFFSET:
                args.set(slot, constant().with(Modifier::SIGNED));
                break;
            case InRole::OFFSET_REL:
                args.set(slot, constant(true).with(Modifier::SIGNED));
                break;
            case InRole::IMMEDIATE:
                args.set(slot, constant(false, true));
                break;
            case InRole::INDEX:
                args.set(slot, constant().with(Modifier::INDEX));
                break;
            case InRole::IMMEDIATE_NEG:
                args.set(slot, constant(false, true).with(Modifier::NEGATE));
                break;
            case InRole::IMMEDIATE_SIGNED:
                args.set(slot, constant(false, true).with(Modifier::SIGNED));
                break;
            case InRole::BASE:
                args.set(slot, Operand::reg(deref()));
                break;
        }
        if (step.separator_after) {
            optional_comma();
        }
    }
    return args;
}

void Parser::format_out(const InstructionDef& def, const Args& args) {
    if (def.output.empty()) {
        throw InternalError("no output format for " + def.name);
    }

    std::vector<Operand> o;
    for (const auto& step : def.output) {
        switch (step.kind) {
            case OutKind::SLOT: o.push_back(args.get(step.slot)); break;
            case OutKind::ZERO: o.push_back(Operand::number(0)); break;
            case OutKind::CONSTANT: o.push_back(Operand::number(def.constant)); break;
            case OutKind::FORMAT_CONSTANT: o.push_back(Operand::number(def.format_constant)); break;
        }
    }

    switch (def.shape) {
        case Shape::JUMP:
            out.add_instruction_j(stmt_file, stmt_line, def.opcode, o[0]);
            break;
        case Shape::IMMEDIATE:
            out.add_instruction_i(stmt_file, stmt_line, def.opcode, o[0], o[1], o[2]);
            break;
        case Shape::REGISTER:
            out.add_instruction_r(stmt_file, stmt_line, def.opcode, o[0], o[1], o[2], o[3], o[4]);
            break;
    }
}

void Parser::format_out(const std::string& mnemonic, const Args& args) {
    const InstructionDef* def = table.find(mnemonic);
    if (!def) {
        throw InternalError("instruction table has no " + mnemonic);
    }
    format_out(*def, args);
}

// =============================================================================
// Load/Store at Address
// =============================================================================

// op reg, (base)           -> op reg, 0(base)
// op reg, addr(base)       -> op reg, addr(base)         addr fits signed 16 bits
// op reg, addr[(index)]    -> lui at, upper(addr)
//                             [addu at, at, index]
//                             op reg, lower(addr)(at)
void Parser::address_form(const InstructionDef& def) {
    Args args;
    Slot transfer = (def.transfer_class == RegisterClass::FPU) ? Slot::FT : Slot::RT;
    args.set(transfer, Operand::reg(reg(def.transfer_class)));
    optional_comma();

    if (type() == TokenType::DEREF) {
        args.set(Slot::OFFSET, Operand::number(0));
        args.set(Slot::BASE, Operand::reg(deref()));
        format_out(def, args);
        return;
    }

    Operand addr = constant();
    args.set(Slot::OFFSET, addr.with(Modifier::LOWER));

    // The offset is sign-extended, so 0x8000..0xFFFF needs the upper half too
    if (addr.is_label() || !fits_signed(addr.value, 16)) {
        Args lui;
        lui.set(Slot::RT, Operand::reg(SCRATCH_REGISTER));
        lui.set(Slot::IMMEDIATE, addr.with(Modifier::UPPER));
        format_out("LUI", lui);

        if (!is_eol()) {
            Args addu;
            addu.set(Slot::RD, Operand::reg(SCRATCH_REGISTER));
            addu.set(Slot::RS, Operand::reg(SCRATCH_REGISTER));
            addu.set(Slot::RT, Operand::reg(deref()));
            format_out("ADDU", addu);
        }
        args.set(Slot::BASE, Operand::reg(SCRATCH_REGISTER));
    } else {
        args.set(Slot::BASE, Operand::reg(deref()));
    }

    format_out(def, args);
}

// =============================================================================
// Instructions
// =============================================================================

void Parser::instruction() {
    mark_statement();
    std::string name = current().text;
    advance();

    const InstructionDef* def = table.find(name);
    if (!def) {
        throw InternalError("undefined instruction " + name);
    }

    if (const Override* hook = overrides.find(name)) {
        hook->parse(*this, name);
    } else if (def->handling == Handling::ADDRESS) {
        address_form(*def);
    } else if (def->handling == Handling::GENERIC) {
        format_out(*def, format_in(*def));
    } else {
        throw error("unimplemented instruction");
    }

    expect_eol();
}

// =============================================================================
// Main Loop
// =============================================================================

Image Parser::parse(TokenSource& source) {
    tokens = Resolver::run(source, main_file);
    pos = 0;

    while (true) {
        const Token& t = current();
        switch (t.type) {
            case TokenType::END_OF_FILE:
                if (t.file == main_file) {
                    return out.dump();
                }
                advance();
                break;
            case TokenType::EOL:
                advance();
                break;
            case TokenType::DEF:
                // Recorded by the resolver: skip name and value
                advance();
                advance();
                break;
            case TokenType::DIR:
                directive();
                break;
            case TokenType::LABEL:
                out.add_label(t.file, t.line, t.text);
                advance();
                break;
            case TokenType::INSTR:
                instruction();
                break;
            default:
                throw error("unexpected token (unknown instruction?)");
        }
    }
}
