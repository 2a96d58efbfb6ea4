/**
 * instructions.hpp
 *
 * Instruction table. Every mnemonic is described by an opcode and a pair of
 * format strings: the input format names the operands to parse, in source
 * order, and the output format places them into the fields of one of three
 * encodings. Format strings are compiled into role lists and validated when
 * the table is built.
 *
 * Input characters:
 *   d s t   general register  -> rd rs rt
 *   D S T   FPU register      -> fd fs ft
 *   X Y Z   system register   -> rd rs rt
 *   o       offset (label allowed)
 *   r       offset, labels are branch-relative
 *   i       immediate (no label)
 *   I       jump index (label allowed)
 *   k       negated immediate (no label)
 *   K       signed immediate (no label)
 *   b       dereferenced base register
 *
 * Output characters: d s t D S T o i I b, 0 (zero), C (constant),
 * F (format constant). Length 1, 3 or 5 selects J, I or R type.
 *
 * The input formats "tob" and "Tob" mark the load/store-at-address form.
 */

#ifndef INSTRUCTIONS_HPP
#define INSTRUCTIONS_HPP

#include "common.hpp"
#include "operand.hpp"
#include "registers.hpp"

// =============================================================================
// Compiled Format
// =============================================================================

enum class InRole {
    GPR_D, GPR_S, GPR_T,
    FPR_D, FPR_S, FPR_T,
    SYS_D, SYS_S, SYS_T,
    OFFSET,
    OFFSET_REL,
    IMMEDIATE,
    INDEX,
    IMMEDIATE_NEG,
    IMMEDIATE_SIGNED,
    BASE
};

struct InputStep {
    InRole role;
    bool separator_after;   // an optional separator may follow
};

enum class OutKind {
    SLOT,
    ZERO,
    CONSTANT,
    FORMAT_CONSTANT
};

struct OutputStep {
    OutKind kind = OutKind::ZERO;
    Slot slot = Slot::RD;
};

enum class Shape {
    JUMP,       // opcode | target
    IMMEDIATE,  // opcode | rs | rt | imm
    REGISTER    // opcode | rs | rt | rd | sa | funct
};

enum class Handling {
    GENERIC,
    ADDRESS,        // load/store at address pseudo-form
    UNIMPLEMENTED
};

struct InstructionDef {
    std::string name;
    Word opcode = 0;
    Handling handling = Handling::GENERIC;
    RegisterClass transfer_class = RegisterClass::GENERAL;   // ADDRESS forms only

    std::vector<InputStep> input;
    std::vector<OutputStep> output;
    Shape shape = Shape::REGISTER;

    Value constant = 0;
    Value format_constant = 0;
};

// =============================================================================
// Instruction Table
// =============================================================================

class InstructionTable {
public:
    struct Entry {
        const char* name;
        Word opcode;
        const char* in;         // nullptr: unimplemented
        const char* out;
        Value constant;
        Value format_constant;
    };

    // Compiles and validates every entry; throws InternalError on a bad format
    explicit InstructionTable(const std::vector<Entry>& entries);

    // The built-in MIPS table
    static const InstructionTable& mips();

    const InstructionDef* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }
    size_t size() const { return defs.size(); }

    static Slot slot_for(InRole role);
    static Shape shape_for(size_t out_length);

private:
    std::map<std::string, InstructionDef> defs;

    static InstructionDef compile(const Entry& e);
};

#endif // INSTRUCTIONS_HPP
