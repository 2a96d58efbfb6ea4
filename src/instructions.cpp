/**
 * instructions.cpp
 *
 * Built-in MIPS (R4300 class) instruction table and format compiler.
 */

#include "instructions.hpp"
#include "errors.hpp"

namespace {

// Opcode groups
constexpr Word OP_SPECIAL = 0;
constexpr Word OP_REGIMM  = 1;
constexpr Word OP_COP0    = 16;
constexpr Word OP_COP1    = 17;

// COP1 fmt field
constexpr Value FMT_S = 16;
constexpr Value FMT_D = 17;
constexpr Value FMT_W = 20;

bool role_from_char(char c, InRole& role) {
    switch (c) {
        case 'd': role = InRole::GPR_D; return true;
        case 's': role = InRole::GPR_S; return true;
        case 't': role = InRole::GPR_T; return true;
        case 'D': role = InRole::FPR_D; return true;
        case 'S': role = InRole::FPR_S; return true;
        case 'T': role = InRole::FPR_T; return true;
        case 'X': role = InRole::SYS_D; return true;
        case 'Y': role = InRole::SYS_S; return true;
        case 'Z': role = InRole::SYS_T; return true;
        case 'o': role = InRole::OFFSET; return true;
        case 'r': role = InRole::OFFSET_REL; return true;
        case 'i': role = InRole::IMMEDIATE; return true;
        case 'I': role = InRole::INDEX; return true;
        case 'k': role = InRole::IMMEDIATE_NEG; return true;
        case 'K': role = InRole::IMMEDIATE_SIGNED; return true;
        case 'b': role = InRole::BASE; return true;
        default: return false;
    }
}

// A base register is written straight after its offset, never after a comma
bool takes_separator_before(char c) {
    return c != 'b';
}

bool slot_from_char(char c, Slot& slot) {
    switch (c) {
        case 'd': slot = Slot::RD; return true;
        case 's': slot = Slot::RS; return true;
        case 't': slot = Slot::RT; return true;
        case 'D': slot = Slot::FD; return true;
        case 'S': slot = Slot::FS; return true;
        case 'T': slot = Slot::FT; return true;
        case 'o': slot = Slot::OFFSET; return true;
        case 'i': slot = Slot::IMMEDIATE; return true;
        case 'I': slot = Slot::INDEX; return true;
        case 'b': slot = Slot::BASE; return true;
        default: return false;
    }
}

const std::vector<InstructionTable::Entry>& mips_entries() {
    static const std::vector<InstructionTable::Entry> entries = {
        // name        opcode       in      out      const  fmt

        // SPECIAL: three-register ALU
        {"ADD",     OP_SPECIAL, "dst", "std0C", 32, 0},
        {"ADDU",    OP_SPECIAL, "dst", "std0C", 33, 0},
        {"SUB",     OP_SPECIAL, "dst", "std0C", 34, 0},
        {"SUBU",    OP_SPECIAL, "dst", "std0C", 35, 0},
        {"AND",     OP_SPECIAL, "dst", "std0C", 36, 0},
        {"OR",      OP_SPECIAL, "dst", "std0C", 37, 0},
        {"XOR",     OP_SPECIAL, "dst", "std0C", 38, 0},
        {"NOR",     OP_SPECIAL, "dst", "std0C", 39, 0},
        {"SLT",     OP_SPECIAL, "dst", "std0C", 42, 0},
        {"SLTU",    OP_SPECIAL, "dst", "std0C", 43, 0},
        {"DADD",    OP_SPECIAL, "dst", "std0C", 44, 0},
        {"DADDU",   OP_SPECIAL, "dst", "std0C", 45, 0},
        {"DSUB",    OP_SPECIAL, "dst", "std0C", 46, 0},
        {"DSUBU",   OP_SPECIAL, "dst", "std0C", 47, 0},

        // SPECIAL: variable shifts (rd, rt, rs)
        {"SLLV",    OP_SPECIAL, "dts", "std0C", 4, 0},
        {"SRLV",    OP_SPECIAL, "dts", "std0C", 6, 0},
        {"SRAV",    OP_SPECIAL, "dts", "std0C", 7, 0},
        {"DSLLV",   OP_SPECIAL, "dts", "std0C", 20, 0},
        {"DSRLV",   OP_SPECIAL, "dts", "std0C", 22, 0},
        {"DSRAV",   OP_SPECIAL, "dts", "std0C", 23, 0},

        // SPECIAL: constant shifts
        {"SLL",     OP_SPECIAL, "dti", "0tdiC", 0, 0},
        {"SRL",     OP_SPECIAL, "dti", "0tdiC", 2, 0},
        {"SRA",     OP_SPECIAL, "dti", "0tdiC", 3, 0},
        {"DSLL",    OP_SPECIAL, "dti", "0tdiC", 56, 0},
        {"DSRL",    OP_SPECIAL, "dti", "0tdiC", 58, 0},
        {"DSRA",    OP_SPECIAL, "dti", "0tdiC", 59, 0},
        {"DSLL32",  OP_SPECIAL, "dti", "0tdiC", 60, 0},
        {"DSRL32",  OP_SPECIAL, "dti", "0tdiC", 62, 0},
        {"DSRA32",  OP_SPECIAL, "dti", "0tdiC", 63, 0},

        // SPECIAL: jumps, HI/LO, multiply/divide, system
        {"JR",      OP_SPECIAL, "s",   "s000C", 8, 0},
        {"MFHI",    OP_SPECIAL, "d",   "00d0C", 16, 0},
        {"MTHI",    OP_SPECIAL, "s",   "s000C", 17, 0},
        {"MFLO",    OP_SPECIAL, "d",   "00d0C", 18, 0},
        {"MTLO",    OP_SPECIAL, "s",   "s000C", 19, 0},
        {"MULT",    OP_SPECIAL, "st",  "st00C", 24, 0},
        {"MULTU",   OP_SPECIAL, "st",  "st00C", 25, 0},
        {"DIV",     OP_SPECIAL, "st",  "st00C", 26, 0},
        {"DIVU",    OP_SPECIAL, "st",  "st00C", 27, 0},
        {"DMULT",   OP_SPECIAL, "st",  "st00C", 28, 0},
        {"DMULTU",  OP_SPECIAL, "st",  "st00C", 29, 0},
        {"DDIV",    OP_SPECIAL, "st",  "st00C", 30, 0},
        {"DDIVU",   OP_SPECIAL, "st",  "st00C", 31, 0},
        {"SYSCALL", OP_SPECIAL, "",    "0000C", 12, 0},
        {"BREAK",   OP_SPECIAL, "",    "0000C", 13, 0},
        {"SYNC",    OP_SPECIAL, "",    "0000C", 15, 0},
        {"JALR",    OP_SPECIAL, "ds",  "s0d0C", 9, 0},   // overridden for the one-operand form

        // Immediate ALU
        {"ADDI",    8,  "tsK", "sti", 0, 0},
        {"ADDIU",   9,  "tsK", "sti", 0, 0},
        {"SLTI",    10, "tsK", "sti", 0, 0},
        {"SLTIU",   11, "tsK", "sti", 0, 0},
        {"ANDI",    12, "tsi", "sti", 0, 0},
        {"ORI",     13, "tsi", "sti", 0, 0},
        {"XORI",    14, "tsi", "sti", 0, 0},
        {"LUI",     15, "ti",  "0ti", 0, 0},
        {"DADDI",   24, "tsK", "sti", 0, 0},
        {"DADDIU",  25, "tsK", "sti", 0, 0},

        // Loads and stores
        {"LB",      32, "tob", "bto", 0, 0},
        {"LH",      33, "tob", "bto", 0, 0},
        {"LWL",     34, "tob", "bto", 0, 0},
        {"LW",      35, "tob", "bto", 0, 0},
        {"LBU",     36, "tob", "bto", 0, 0},
        {"LHU",     37, "tob", "bto", 0, 0},
        {"LWR",     38, "tob", "bto", 0, 0},
        {"LWU",     39, "tob", "bto", 0, 0},
        {"SB",      40, "tob", "bto", 0, 0},
        {"SH",      41, "tob", "bto", 0, 0},
        {"SWL",     42, "tob", "bto", 0, 0},
        {"SW",      43, "tob", "bto", 0, 0},
        {"SWR",     46, "tob", "bto", 0, 0},
        {"CACHE",   47, "iob", "bio", 0, 0},
        {"LL",      48, "tob", "bto", 0, 0},
        {"LWC1",    49, "Tob", "bTo", 0, 0},
        {"LDC1",    53, "Tob", "bTo", 0, 0},
        {"LD",      55, "tob", "bto", 0, 0},
        {"SC",      56, "tob", "bto", 0, 0},
        {"SWC1",    57, "Tob", "bTo", 0, 0},
        {"SDC1",    61, "Tob", "bTo", 0, 0},
        {"SD",      63, "tob", "bto", 0, 0},
        {"LDL",     26, nullptr, nullptr, 0, 0},
        {"LDR",     27, nullptr, nullptr, 0, 0},
        {"SDL",     44, nullptr, nullptr, 0, 0},
        {"SDR",     45, nullptr, nullptr, 0, 0},

        // Branches
        {"BEQ",     4,  "str", "sto", 0, 0},
        {"BNE",     5,  "str", "sto", 0, 0},
        {"BLEZ",    6,  "sr",  "s0o", 0, 0},
        {"BGTZ",    7,  "sr",  "s0o", 0, 0},
        {"BEQL",    20, "str", "sto", 0, 0},
        {"BNEL",    21, "str", "sto", 0, 0},
        {"BLEZL",   22, "sr",  "s0o", 0, 0},
        {"BGTZL",   23, "sr",  "s0o", 0, 0},
        {"BLTZ",    OP_REGIMM, "sr", "sCo", 0, 0},
        {"BGEZ",    OP_REGIMM, "sr", "sCo", 1, 0},
        {"BLTZL",   OP_REGIMM, "sr", "sCo", 2, 0},
        {"BGEZL",   OP_REGIMM, "sr", "sCo", 3, 0},
        {"BLTZAL",  OP_REGIMM, "sr", "sCo", 16, 0},
        {"BGEZAL",  OP_REGIMM, "sr", "sCo", 17, 0},

        // Jumps
        {"J",       2,  "I", "I", 0, 0},
        {"JAL",     3,  "I", "I", 0, 0},

        // COP0
        {"MFC0",    OP_COP0, "tX", "Ctd00", 0, 0},
        {"MTC0",    OP_COP0, "tX", "Ctd00", 4, 0},
        {"TLBR",    OP_COP0, "",   "C000F", 16, 1},
        {"TLBWI",   OP_COP0, "",   "C000F", 16, 2},
        {"TLBWR",   OP_COP0, "",   "C000F", 16, 6},
        {"TLBP",    OP_COP0, "",   "C000F", 16, 8},
        {"ERET",    OP_COP0, "",   "C000F", 16, 24},

        // COP1 moves and branches
        {"MFC1",    OP_COP1, "tS", "CtS00", 0, 0},
        {"DMFC1",   OP_COP1, "tS", "CtS00", 1, 0},
        {"MTC1",    OP_COP1, "tS", "CtS00", 4, 0},
        {"DMTC1",   OP_COP1, "tS", "CtS00", 5, 0},
        {"CFC1",    OP_COP1, nullptr, nullptr, 2, 0},
        {"CTC1",    OP_COP1, nullptr, nullptr, 6, 0},
        {"BC1F",    OP_COP1, "r", "C0o", 8, 0},
        {"BC1T",    OP_COP1, "r", "CFo", 8, 1},

        // COP1 arithmetic
        {"ADD.S",   OP_COP1, "DST", "FTSDC", 0, FMT_S},
        {"ADD.D",   OP_COP1, "DST", "FTSDC", 0, FMT_D},
        {"SUB.S",   OP_COP1, "DST", "FTSDC", 1, FMT_S},
        {"SUB.D",   OP_COP1, "DST", "FTSDC", 1, FMT_D},
        {"MUL.S",   OP_COP1, "DST", "FTSDC", 2, FMT_S},
        {"MUL.D",   OP_COP1, "DST", "FTSDC", 2, FMT_D},
        {"DIV.S",   OP_COP1, "DST", "FTSDC", 3, FMT_S},
        {"DIV.D",   OP_COP1, "DST", "FTSDC", 3, FMT_D},
        {"SQRT.S",  OP_COP1, "DS",  "F0SDC", 4, FMT_S},
        {"SQRT.D",  OP_COP1, "DS",  "F0SDC", 4, FMT_D},
        {"ABS.S",   OP_COP1, "DS",  "F0SDC", 5, FMT_S},
        {"ABS.D",   OP_COP1, "DS",  "F0SDC", 5, FMT_D},
        {"MOV.S",   OP_COP1, "DS",  "F0SDC", 6, FMT_S},
        {"MOV.D",   OP_COP1, "DS",  "F0SDC", 6, FMT_D},
        {"NEG.S",   OP_COP1, "DS",  "F0SDC", 7, FMT_S},
        {"NEG.D",   OP_COP1, "DS",  "F0SDC", 7, FMT_D},
        {"TRUNC.W.S", OP_COP1, "DS", "F0SDC", 13, FMT_S},
        {"TRUNC.W.D", OP_COP1, "DS", "F0SDC", 13, FMT_D},
        {"CVT.S.D", OP_COP1, "DS",  "F0SDC", 32, FMT_D},
        {"CVT.S.W", OP_COP1, "DS",  "F0SDC", 32, FMT_W},
        {"CVT.D.S", OP_COP1, "DS",  "F0SDC", 33, FMT_S},
        {"CVT.D.W", OP_COP1, "DS",  "F0SDC", 33, FMT_W},
        {"CVT.W.S", OP_COP1, "DS",  "F0SDC", 36, FMT_S},
        {"CVT.W.D", OP_COP1, "DS",  "F0SDC", 36, FMT_D},
        {"C.EQ.S",  OP_COP1, "ST",  "FTS0C", 50, FMT_S},
        {"C.EQ.D",  OP_COP1, "ST",  "FTS0C", 50, FMT_D},
        {"C.LT.S",  OP_COP1, "ST",  "FTS0C", 60, FMT_S},
        {"C.LT.D",  OP_COP1, "ST",  "FTS0C", 60, FMT_D},
        {"C.LE.S",  OP_COP1, "ST",  "FTS0C", 62, FMT_S},
        {"C.LE.D",  OP_COP1, "ST",  "FTS0C", 62, FMT_D},

        // Pseudo-instructions with a single real encoding
        {"NOP",     OP_SPECIAL, "",    "00000", 0, 0},
        {"MOVE",    OP_SPECIAL, "ds",  "s0d0C", 33, 0},     // addu d, s, zero
        {"NEGU",    OP_SPECIAL, "dt",  "0td0C", 35, 0},     // subu d, zero, t
        {"NOT",     OP_SPECIAL, "ds",  "s0d0C", 39, 0},     // nor d, s, zero
        {"B",       4,          "r",   "00o",   0, 0},      // beq zero, zero
        {"BAL",     OP_REGIMM,  "r",   "0Co",   17, 0},     // bgezal zero
        {"BEQZ",    4,          "sr",  "s0o",   0, 0},
        {"BNEZ",    5,          "sr",  "s0o",   0, 0},
        {"SUBI",    8,          "tsk", "sti",   0, 0},      // addi t, s, -k
        {"SUBIU",   9,          "tsk", "sti",   0, 0},

        // Handled entirely by overrides
        {"LI",      9,  "tK", "0ti", 0, 0},
        {"LA",      9,  "to", "0to", 0, 0},
        {"PUSH",    OP_SPECIAL, nullptr, nullptr, 0, 0},
        {"POP",     OP_SPECIAL, nullptr, nullptr, 0, 0},
        {"JPOP",    OP_SPECIAL, nullptr, nullptr, 0, 0},
    };
    return entries;
}

} // namespace

// =============================================================================
// Format Compiler
// =============================================================================

Slot InstructionTable::slot_for(InRole role) {
    switch (role) {
        case InRole::GPR_D: case InRole::SYS_D: return Slot::RD;
        case InRole::GPR_S: case InRole::SYS_S: return Slot::RS;
        case InRole::GPR_T: case InRole::SYS_T: return Slot::RT;
        case InRole::FPR_D: return Slot::FD;
        case InRole::FPR_S: return Slot::FS;
        case InRole::FPR_T: return Slot::FT;
        case InRole::OFFSET: case InRole::OFFSET_REL: return Slot::OFFSET;
        case InRole::IMMEDIATE: case InRole::IMMEDIATE_NEG:
        case InRole::IMMEDIATE_SIGNED: return Slot::IMMEDIATE;
        case InRole::INDEX: return Slot::INDEX;
        case InRole::BASE: return Slot::BASE;
    }
    throw InternalError("unknown operand role");
}

Shape InstructionTable::shape_for(size_t out_length) {
    switch (out_length) {
        case 1: return Shape::JUMP;
        case 3: return Shape::IMMEDIATE;
        case 5: return Shape::REGISTER;
        default: break;
    }
    throw InternalError("invalid output formatting string");
}

InstructionDef InstructionTable::compile(const Entry& e) {
    InstructionDef def;
    def.name = e.name;
    def.opcode = e.opcode;
    def.constant = e.constant;
    def.format_constant = e.format_constant;

    if (e.in == nullptr) {
        def.handling = Handling::UNIMPLEMENTED;
        return def;
    }
    if (e.out == nullptr) {
        throw InternalError("missing output formatting string for " + def.name);
    }

    std::string in = e.in;
    std::string out = e.out;

    if (in == "tob" || in == "Tob") {
        def.handling = Handling::ADDRESS;
        def.transfer_class = (in[0] == 't') ? RegisterClass::GENERAL : RegisterClass::FPU;
    }

    bool filled[static_cast<size_t>(Slot::COUNT)] = {};
    for (size_t i = 0; i < in.size(); i++) {
        InRole role;
        if (!role_from_char(in[i], role)) {
            throw InternalError("invalid input formatting string for " + def.name);
        }
        size_t slot = static_cast<size_t>(slot_for(role));
        if (filled[slot]) {
            throw InternalError("invalid input formatting string for " + def.name +
                                " (operand parsed twice)");
        }
        filled[slot] = true;

        bool separator = i + 1 < in.size() && takes_separator_before(in[i + 1]);
        def.input.push_back({role, separator});
    }

    if (out.size() != 1 && out.size() != 3 && out.size() != 5) {
        throw InternalError("invalid output formatting string for " + def.name);
    }
    def.shape = shape_for(out.size());

    for (char c : out) {
        OutputStep step;
        if (c == '0') {
            step.kind = OutKind::ZERO;
        } else if (c == 'C') {
            step.kind = OutKind::CONSTANT;
        } else if (c == 'F') {
            step.kind = OutKind::FORMAT_CONSTANT;
        } else if (slot_from_char(c, step.slot)) {
            step.kind = OutKind::SLOT;
            if (!filled[static_cast<size_t>(step.slot)]) {
                throw InternalError("output formatting string for " + def.name +
                                    " uses an operand that is never parsed");
            }
        } else {
            throw InternalError("invalid output formatting string for " + def.name);
        }
        def.output.push_back(step);
    }

    return def;
}

// =============================================================================
// Table
// =============================================================================

InstructionTable::InstructionTable(const std::vector<Entry>& entries) {
    for (const auto& e : entries) {
        InstructionDef def = compile(e);
        std::string key = to_upper(def.name);
        if (defs.count(key)) {
            throw InternalError("duplicate instruction " + key);
        }
        defs.emplace(key, std::move(def));
    }
}

const InstructionTable& InstructionTable::mips() {
    static const InstructionTable table(mips_entries());
    return table;
}

const InstructionDef* InstructionTable::find(const std::string& name) const {
    auto it = defs.find(to_upper(name));
    return (it != defs.end()) ? &it->second : nullptr;
}
