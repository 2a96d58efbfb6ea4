/**
 * operand.cpp
 */

#include "operand.hpp"
#include "errors.hpp"

Operand Operand::reg(int number) {
    Operand op;
    op.kind = OperandKind::REGISTER;
    op.value = number;
    return op;
}

Operand Operand::number(Value v) {
    Operand op;
    op.kind = OperandKind::NUMBER;
    op.value = v;
    return op;
}

Operand Operand::symbol(const std::string& name, bool relative) {
    Operand op;
    op.kind = relative ? OperandKind::LABEL_REL : OperandKind::LABEL;
    op.label = name;
    return op;
}

Operand Operand::with(Modifier m) const {
    Operand op = *this;
    op.modifier = m;
    return op;
}

std::string Operand::describe() const {
    switch (kind) {
        case OperandKind::NONE: return "none";
        case OperandKind::REGISTER: return "r" + std::to_string(value);
        case OperandKind::NUMBER: return std::to_string(value);
        case OperandKind::LABEL: return label;
        case OperandKind::LABEL_REL: return label + " (relative)";
    }
    return "?";
}

const Operand& Args::get(Slot s) const {
    const auto& op = slots[static_cast<size_t>(s)];
    if (!op) {
        throw InternalError(std::string("missing operand for ") + slot_name(s));
    }
    return *op;
}

void Args::set(Slot s, const Operand& op) {
    slots[static_cast<size_t>(s)] = op;
}

const char* slot_name(Slot s) {
    switch (s) {
        case Slot::RD: return "rd";
        case Slot::RS: return "rs";
        case Slot::RT: return "rt";
        case Slot::FD: return "fd";
        case Slot::FS: return "fs";
        case Slot::FT: return "ft";
        case Slot::OFFSET: return "offset";
        case Slot::IMMEDIATE: return "immediate";
        case Slot::INDEX: return "index";
        case Slot::BASE: return "base";
        case Slot::COUNT: break;
    }
    return "?";
}
