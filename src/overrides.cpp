/**
 * overrides.cpp
 *
 * Irregular mnemonics: pseudo-instructions that expand to a variable number
 * of real instructions, and instructions with optional operands.
 */

#include "overrides.hpp"
#include "parser.hpp"

namespace {

constexpr int REG_ZERO = 0;
constexpr int REG_SP = 29;
constexpr int REG_RA = 31;

// rt = rs + imm (16-bit)
void addiu(Parser& p, int rt, int rs, const Operand& imm) {
    Args a;
    a.set(Slot::RT, Operand::reg(rt));
    a.set(Slot::RS, Operand::reg(rs));
    a.set(Slot::IMMEDIATE, imm);
    p.format_out("ADDIU", a);
}

void ori(Parser& p, int rt, int rs, Value imm) {
    Args a;
    a.set(Slot::RT, Operand::reg(rt));
    a.set(Slot::RS, Operand::reg(rs));
    a.set(Slot::IMMEDIATE, Operand::number(imm));
    p.format_out("ORI", a);
}

void lui(Parser& p, int rt, const Operand& imm) {
    Args a;
    a.set(Slot::RT, Operand::reg(rt));
    a.set(Slot::IMMEDIATE, imm);
    p.format_out("LUI", a);
}

// LW/SW reg, offset(sp)
void stack_access(Parser& p, const std::string& op, int rt, Value offset) {
    Args a;
    a.set(Slot::RT, Operand::reg(rt));
    a.set(Slot::OFFSET, Operand::number(offset).with(Modifier::SIGNED));
    a.set(Slot::BASE, Operand::reg(REG_SP));
    p.format_out(op, a);
}

// One or more general registers, optionally comma separated
std::vector<int> register_list(Parser& p) {
    std::vector<int> regs;
    do {
        regs.push_back(p.reg());
        p.optional_comma();
    } while (!p.is_eol());
    return regs;
}

// =============================================================================
// Hooks
// =============================================================================

// LI rt, imm: one instruction when the value fits 16 bits, else LUI/ORI
class LoadImmediate : public Override {
public:
    void parse(Parser& p, const std::string&) const override {
        int rt = p.reg();
        p.optional_comma();
        Operand imm = p.constant(false, true);
        Value v = imm.value;

        if (fits_signed(v, 16)) {
            addiu(p, rt, REG_ZERO, imm.with(Modifier::SIGNED));
        } else if (fits_unsigned(v, 16)) {
            ori(p, rt, REG_ZERO, v);
        } else if (fits_unsigned(v, 32) || fits_signed(v, 32)) {
            Word w = static_cast<Word>(v);
            lui(p, rt, Operand::number(w >> 16));
            if (w & 0xFFFF) {
                ori(p, rt, rt, w & 0xFFFF);
            }
        } else {
            throw p.error("immediate out of range");
        }
    }
};

// LA rt, addr: LUI + ADDIU, works for labels and numbers alike
class LoadAddress : public Override {
public:
    void parse(Parser& p, const std::string&) const override {
        int rt = p.reg();
        p.optional_comma();
        Operand addr = p.constant();
        lui(p, rt, addr.with(Modifier::UPPER));
        addiu(p, rt, rt, addr.with(Modifier::LOWER));
    }
};

// JALR rs  or  JALR rd, rs
class JumpAndLinkRegister : public Override {
public:
    void parse(Parser& p, const std::string& name) const override {
        int first = p.reg();
        Args a;
        if (p.is_eol()) {
            a.set(Slot::RD, Operand::reg(REG_RA));
            a.set(Slot::RS, Operand::reg(first));
        } else {
            p.optional_comma();
            a.set(Slot::RD, Operand::reg(first));
            a.set(Slot::RS, Operand::reg(p.reg()));
        }
        p.format_out(name, a);
    }
};

class Push : public Override {
public:
    void parse(Parser& p, const std::string&) const override {
        std::vector<int> regs = register_list(p);
        Value size = static_cast<Value>(regs.size()) * 4;
        addiu(p, REG_SP, REG_SP, Operand::number(-size).with(Modifier::SIGNED));
        for (size_t i = 0; i < regs.size(); i++) {
            stack_access(p, "SW", regs[i], static_cast<Value>(i) * 4);
        }
    }
};

// POP restores in PUSH order; JPOP also returns, freeing the frame in the delay slot
class Pop : public Override {
public:
    explicit Pop(bool jump) : jump(jump) {}

    void parse(Parser& p, const std::string&) const override {
        std::vector<int> regs = register_list(p);
        Value size = static_cast<Value>(regs.size()) * 4;
        for (size_t i = 0; i < regs.size(); i++) {
            stack_access(p, "LW", regs[i], static_cast<Value>(i) * 4);
        }
        if (jump) {
            Args jr;
            jr.set(Slot::RS, Operand::reg(REG_RA));
            p.format_out("JR", jr);
        }
        addiu(p, REG_SP, REG_SP, Operand::number(size).with(Modifier::SIGNED));
    }

private:
    bool jump;
};

} // namespace

// =============================================================================
// Registry
// =============================================================================

const Overrides& Overrides::defaults() {
    static const Overrides registry = [] {
        Overrides o;
        o.add("LI", std::make_unique<LoadImmediate>());
        o.add("LA", std::make_unique<LoadAddress>());
        o.add("JALR", std::make_unique<JumpAndLinkRegister>());
        o.add("PUSH", std::make_unique<Push>());
        o.add("POP", std::make_unique<Pop>(false));
        o.add("JPOP", std::make_unique<Pop>(true));
        return o;
    }();
    return registry;
}

void Overrides::add(const std::string& name, std::unique_ptr<Override> hook) {
    hooks[to_upper(name)] = std::move(hook);
}

const Override* Overrides::find(const std::string& name) const {
    auto it = hooks.find(to_upper(name));
    return (it != hooks.end()) ? it->second.get() : nullptr;
}
