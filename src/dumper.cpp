/**
 * dumper.cpp
 *
 * Binary emitter implementation.
 * Pass 1: Assign label addresses
 * Pass 2: Encode and write bytes
 */

#include "dumper.hpp"

// =============================================================================
// Requests
// =============================================================================

void Dumper::add_label(const std::string& file, int line, const std::string& name) {
    Statement st;
    st.kind = Kind::LABEL;
    st.file = file;
    st.line = line;
    st.name = name;
    statements.push_back(std::move(st));
}

void Dumper::add_directive(const std::string& file, int line, const std::string& name,
                           const std::vector<Operand>& args) {
    Statement st;
    st.kind = Kind::DIRECTIVE;
    st.file = file;
    st.line = line;
    st.name = name;
    st.args = args;
    statements.push_back(std::move(st));
}

void Dumper::add_instruction_j(const std::string& file, int line, Word first,
                               const Operand& a) {
    Statement st;
    st.file = file;
    st.line = line;
    st.shape = Shape::JUMP;
    st.first = first;
    st.args = {a};
    statements.push_back(std::move(st));
}

void Dumper::add_instruction_i(const std::string& file, int line, Word first,
                               const Operand& a, const Operand& b, const Operand& c) {
    Statement st;
    st.file = file;
    st.line = line;
    st.shape = Shape::IMMEDIATE;
    st.first = first;
    st.args = {a, b, c};
    statements.push_back(std::move(st));
}

void Dumper::add_instruction_r(const std::string& file, int line, Word first,
                               const Operand& a, const Operand& b, const Operand& c,
                               const Operand& d, const Operand& e) {
    Statement st;
    st.file = file;
    st.line = line;
    st.shape = Shape::REGISTER;
    st.first = first;
    st.args = {a, b, c, d, e};
    statements.push_back(std::move(st));
}

AsmError Dumper::error(const Statement& st, const std::string& msg) const {
    return AsmError(st.file, st.line, msg);
}

// =============================================================================
// Layout
// =============================================================================

Address Dumper::advance(const Statement& st, Address pc) const {
    Value next = pc;

    if (st.name == "ORG") {
        next = constant(st, st.args.at(0));
    } else if (st.name == "ALIGN") {
        Value n = st.args.empty() ? 0 : constant(st, st.args[0]);
        if (n < 0) throw error(st, "alignment must not be negative");
        if (n == 0) n = DEFAULT_ALIGNMENT;
        Value rem = next % n;
        if (rem != 0) next += n - rem;
    } else if (st.name == "SKIP") {
        Value n = constant(st, st.args.at(0));
        if (n < 0) throw error(st, "skip size must not be negative");
        next += n;
    } else if (st.name == "BYTE") {
        next += 1;
    } else if (st.name == "HALFWORD") {
        next += 2;
    } else if (st.name == "WORD") {
        next += 4;
    } else {
        throw InternalError("directive " + st.name + " reached the emitter");
    }

    if (!fits_unsigned(next, 32)) {
        throw error(st, "address out of range");
    }
    // ORG may jump anywhere; the flattened span is checked in dump()
    if (st.name != "ORG" && next - static_cast<Value>(pc) > static_cast<Value>(MAX_IMAGE_SIZE)) {
        throw error(st, "output image too large");
    }
    return static_cast<Address>(next);
}

void Dumper::layout() {
    labels.clear();
    Address pc = 0;
    for (const auto& st : statements) {
        switch (st.kind) {
            case Kind::LABEL:
                if (labels.count(st.name)) {
                    throw error(st, "duplicate label '" + st.name + "'");
                }
                labels[st.name] = pc;
                break;
            case Kind::DIRECTIVE:
                pc = advance(st, pc);
                break;
            case Kind::INSTRUCTION:
                pc += 4;
                break;
        }
    }
}

// =============================================================================
// Operand Values
// =============================================================================

Address Dumper::label_address(const Statement& st, const std::string& name) const {
    auto it = labels.find(name);
    if (it == labels.end()) {
        throw error(st, "undefined label '" + name + "'");
    }
    return it->second;
}

Value Dumper::constant(const Statement& st, const Operand& op) const {
    switch (op.kind) {
        case OperandKind::NUMBER: return op.value;
        case OperandKind::LABEL: return label_address(st, op.label);
        default: break;
    }
    throw InternalError("directive " + st.name + " given a non-constant operand");
}

Word Dumper::field(const Statement& st, const Operand& op, Address pc, int bits) const {
    Word mask = (bits >= 32) ? 0xFFFFFFFF : ((1U << bits) - 1);
    Value v = 0;

    switch (op.kind) {
        case OperandKind::NONE:
            throw InternalError("empty operand in encoding request");
        case OperandKind::REGISTER:
        case OperandKind::NUMBER:
            v = op.value;
            break;
        case OperandKind::LABEL:
            v = label_address(st, op.label);
            break;
        case OperandKind::LABEL_REL: {
            Value delta = static_cast<Value>(label_address(st, op.label)) -
                          (static_cast<Value>(pc) + 4);
            if (delta % 4 != 0) {
                throw error(st, "branch target '" + op.label + "' is not word aligned");
            }
            v = delta / 4;
            if (!fits_signed(v, bits)) {
                throw error(st, "branch target '" + op.label + "' out of range");
            }
            return static_cast<Word>(v) & mask;
        }
    }

    bool address = op.modifier == Modifier::INDEX || op.modifier == Modifier::UPPER ||
                   op.modifier == Modifier::LOWER;
    if (address && !fits_unsigned(v, 32) && !fits_signed(v, 32)) {
        throw error(st, "address " + op.describe() + " out of range");
    }

    switch (op.modifier) {
        case Modifier::NONE:
        case Modifier::SIGNED:
            break;
        case Modifier::NEGATE:
            v = -v;
            break;
        case Modifier::INDEX:
            if (v % 4 != 0) {
                throw error(st, "jump target " + op.describe() + " is not word aligned");
            }
            v = (static_cast<Word>(v) >> 2) & 0x3FFFFFF;
            break;
        case Modifier::UPPER:
            v = ((static_cast<Word>(v) + 0x8000) >> 16) & 0xFFFF;
            break;
        case Modifier::LOWER:
            v = static_cast<Word>(v) & 0xFFFF;
            break;
    }

    // Wide fields take either signed or unsigned values; narrow fields are unsigned
    bool ok = fits_unsigned(v, bits) || (bits >= 16 && fits_signed(v, bits));
    if (!ok) {
        throw error(st, "value " + op.describe() + " out of range for " +
                        std::to_string(bits) + "-bit field");
    }
    return static_cast<Word>(v) & mask;
}

// =============================================================================
// Encoding
// =============================================================================

Word Dumper::encode(const Statement& st, Address pc) const {
    if (st.first > 0x3F) {
        throw InternalError("opcode " + std::to_string(st.first) + " does not fit 6 bits");
    }

    Word w = st.first << 26;
    const auto& a = st.args;
    switch (st.shape) {
        case Shape::JUMP:
            w |= field(st, a[0], pc, 26);
            break;
        case Shape::IMMEDIATE:
            w |= field(st, a[0], pc, 5) << 21;
            w |= field(st, a[1], pc, 5) << 16;
            w |= field(st, a[2], pc, 16);
            break;
        case Shape::REGISTER:
            w |= field(st, a[0], pc, 5) << 21;
            w |= field(st, a[1], pc, 5) << 16;
            w |= field(st, a[2], pc, 5) << 11;
            w |= field(st, a[3], pc, 5) << 6;
            w |= field(st, a[4], pc, 6);
            break;
    }
    return w;
}

void Dumper::emit_directive(Memory& out, const Statement& st, Address& pc) const {
    if (st.name == "ORG") {
        pc = advance(st, pc);
        return;
    }

    if (st.name == "ALIGN" || st.name == "SKIP") {
        Byte fill = 0;
        if (st.args.size() > 1) {
            Value f = constant(st, st.args[1]);
            if (!fits_unsigned(f, 8) && !fits_signed(f, 8)) {
                throw error(st, "fill value out of range");
            }
            fill = static_cast<Byte>(f);
        }
        Address next = advance(st, pc);
        out.fill(pc, next - pc, fill);
        pc = next;
        return;
    }

    Value v = constant(st, st.args.at(0));
    if (st.name == "BYTE") {
        if (!fits_unsigned(v, 8) && !fits_signed(v, 8)) {
            throw error(st, "byte value " + std::to_string(v) + " out of range");
        }
        out.write_byte(pc, static_cast<Byte>(v));
    } else if (st.name == "HALFWORD") {
        if (!fits_unsigned(v, 16) && !fits_signed(v, 16)) {
            throw error(st, "halfword value " + std::to_string(v) + " out of range");
        }
        out.write_half(pc, static_cast<HalfWord>(v));
    } else if (st.name == "WORD") {
        if (!fits_unsigned(v, 32) && !fits_signed(v, 32)) {
            throw error(st, "word value " + std::to_string(v) + " out of range");
        }
        out.write_word(pc, static_cast<Word>(v));
    }
    pc = advance(st, pc);
}

// =============================================================================
// Dump
// =============================================================================

Image Dumper::dump() {
    if (dumped) {
        throw InternalError("dump requested twice");
    }
    dumped = true;

    layout();

    Memory out;
    Address pc = 0;
    for (const auto& st : statements) {
        switch (st.kind) {
            case Kind::LABEL:
                break;
            case Kind::DIRECTIVE:
                emit_directive(out, st, pc);
                break;
            case Kind::INSTRUCTION:
                out.write_word(pc, encode(st, pc));
                pc += 4;
                break;
        }
        if (!out.empty() && out.highest() - out.lowest() >= MAX_IMAGE_SIZE) {
            throw error(st, "output image too large");
        }
    }

    Image img;
    img.origin = out.lowest();
    img.bytes = out.flatten();
    img.symbols = labels;
    return img;
}
