/**
 * dumper.hpp
 *
 * Default binary emitter. Records every request, then lays out addresses,
 * resolves labels and encodes big-endian MIPS machine code in dump().
 */

#ifndef DUMPER_HPP
#define DUMPER_HPP

#include "common.hpp"
#include "emitter.hpp"
#include "errors.hpp"
#include "instructions.hpp"
#include "memory.hpp"

class Dumper : public Emitter {
public:
    // Largest span a flattened image may cover
    static constexpr Address MAX_IMAGE_SIZE = 64 * 1024 * 1024;

    void add_label(const std::string& file, int line, const std::string& name) override;

    void add_directive(const std::string& file, int line, const std::string& name,
                       const std::vector<Operand>& args) override;

    void add_instruction_j(const std::string& file, int line, Word first,
                           const Operand& a) override;

    void add_instruction_i(const std::string& file, int line, Word first,
                           const Operand& a, const Operand& b, const Operand& c) override;

    void add_instruction_r(const std::string& file, int line, Word first,
                           const Operand& a, const Operand& b, const Operand& c,
                           const Operand& d, const Operand& e) override;

    Image dump() override;

private:
    enum class Kind { LABEL, DIRECTIVE, INSTRUCTION };

    struct Statement {
        Kind kind = Kind::INSTRUCTION;
        std::string file;
        int line = 0;
        std::string name;           // Label or directive name
        Shape shape = Shape::REGISTER;
        Word first = 0;             // Opcode
        std::vector<Operand> args;
    };

    std::vector<Statement> statements;
    std::map<std::string, Address> labels;
    bool dumped = false;

    // Pass 1: assign label addresses
    void layout();

    // Pass 2: write bytes
    void emit_directive(Memory& out, const Statement& st, Address& pc) const;
    Word encode(const Statement& st, Address pc) const;

    // Value of an operand placed into a field of the given width
    Word field(const Statement& st, const Operand& op, Address pc, int bits) const;
    Value constant(const Statement& st, const Operand& op) const;
    Address label_address(const Statement& st, const std::string& name) const;

    // Size a directive occupies at pc (ORG/ALIGN move pc instead)
    Address advance(const Statement& st, Address pc) const;

    AsmError error(const Statement& st, const std::string& msg) const;
};

#endif // DUMPER_HPP
