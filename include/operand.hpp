/**
 * operand.hpp
 *
 * Operand values handed from the parser to the emitter, and the per-instruction
 * bundle of parsed operands keyed by role.
 */

#ifndef OPERAND_HPP
#define OPERAND_HPP

#include "common.hpp"

// =============================================================================
// Operand
// =============================================================================

enum class OperandKind {
    NONE,
    REGISTER,       // value = register number
    NUMBER,         // value = literal
    LABEL,          // label = name, resolved to an absolute address
    LABEL_REL       // label = name, resolved relative to the instruction (branches)
};

// How a constant is transformed before it lands in an encoding field
enum class Modifier {
    NONE,
    SIGNED,         // may be negative
    NEGATE,         // value is negated
    INDEX,          // jump target: address >> 2
    UPPER,          // upper 16 bits of an address, adjusted for a signed lower half
    LOWER           // lower 16 bits of an address
};

struct Operand {
    OperandKind kind = OperandKind::NONE;
    Modifier modifier = Modifier::NONE;
    Value value = 0;
    std::string label;

    static Operand reg(int number);
    static Operand number(Value v);
    static Operand symbol(const std::string& name, bool relative = false);

    // Same constant with a different modifier
    Operand with(Modifier m) const;

    bool is_label() const { return kind == OperandKind::LABEL || kind == OperandKind::LABEL_REL; }

    std::string describe() const;
};

// =============================================================================
// Operand Bundle
// =============================================================================

// Operand roles as they appear in a parsed instruction. Each role holds at
// most one operand.
enum class Slot {
    RD, RS, RT,         // General or system registers
    FD, FS, FT,         // Floating-point registers
    OFFSET,
    IMMEDIATE,
    INDEX,
    BASE,
    COUNT
};

class Args {
public:
    const Operand& get(Slot s) const;
    void set(Slot s, const Operand& op);

private:
    std::optional<Operand> slots[static_cast<size_t>(Slot::COUNT)];
};

const char* slot_name(Slot s);

#endif // OPERAND_HPP
