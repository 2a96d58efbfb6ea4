/**
 * registers.cpp
 *
 * AT (r1) is not addressable from source; the assembler keeps it for
 * synthesized address loads.
 */

#include "registers.hpp"

namespace {

std::map<std::string, int> build_general() {
    std::map<std::string, int> regs = {
        {"ZERO",0},
        {"V0",2},{"V1",3},
        {"A0",4},{"A1",5},{"A2",6},{"A3",7},
        {"T0",8},{"T1",9},{"T2",10},{"T3",11},{"T4",12},{"T5",13},{"T6",14},{"T7",15},
        {"S0",16},{"S1",17},{"S2",18},{"S3",19},{"S4",20},{"S5",21},{"S6",22},{"S7",23},
        {"T8",24},{"T9",25},
        {"K0",26},{"K1",27},
        {"GP",28},{"SP",29},{"FP",30},{"S8",30},{"RA",31}
    };
    for (int i = 0; i < NUM_REGISTERS; i++) {
        if (i == SCRATCH_REGISTER) continue;
        regs["R" + std::to_string(i)] = i;
    }
    return regs;
}

std::map<std::string, int> build_fpu() {
    std::map<std::string, int> regs;
    for (int i = 0; i < NUM_REGISTERS; i++) {
        regs["F" + std::to_string(i)] = i;
    }
    return regs;
}

std::map<std::string, int> build_system() {
    static const char* names[] = {
        "INDEX", "RANDOM", "ENTRYLO0", "ENTRYLO1",
        "CONTEXT", "PAGEMASK", "WIRED", "RESERVED7",
        "BADVADDR", "COUNT", "ENTRYHI", "COMPARE",
        "STATUS", "CAUSE", "EPC", "PRID",
        "CONFIG", "LLADDR", "WATCHLO", "WATCHHI",
        "XCONTEXT", "RESERVED21", "RESERVED22", "RESERVED23",
        "RESERVED24", "RESERVED25", "PERR", "CACHEERR",
        "TAGLO", "TAGHI", "ERROREPC", "RESERVED31"
    };
    std::map<std::string, int> regs;
    for (int i = 0; i < NUM_REGISTERS; i++) {
        regs[names[i]] = i;
    }
    return regs;
}

} // namespace

const std::map<std::string, int>& Registers::table(RegisterClass cls) {
    static const std::map<std::string, int> general = build_general();
    static const std::map<std::string, int> fpu = build_fpu();
    static const std::map<std::string, int> system = build_system();

    switch (cls) {
        case RegisterClass::GENERAL: return general;
        case RegisterClass::FPU: return fpu;
        case RegisterClass::SYSTEM: return system;
    }
    return general;
}

std::optional<int> Registers::lookup(RegisterClass cls, const std::string& name) {
    const auto& t = table(cls);
    auto it = t.find(to_upper(name));
    if (it == t.end()) return std::nullopt;
    return it->second;
}

bool Registers::is_register(const std::string& name) {
    return lookup(RegisterClass::GENERAL, name) ||
           lookup(RegisterClass::FPU, name) ||
           lookup(RegisterClass::SYSTEM, name);
}
