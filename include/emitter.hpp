/**
 * emitter.hpp
 *
 * Interface between the parser and the binary emitter. The parser issues
 * fully resolved requests, each tagged with its source position; the emitter
 * owns addresses, label values and the final byte layout.
 */

#ifndef EMITTER_HPP
#define EMITTER_HPP

#include "common.hpp"
#include "operand.hpp"

// Assembled output
struct Image {
    Address origin = 0;                         // Address of bytes[0]
    std::vector<Byte> bytes;
    std::map<std::string, Address> symbols;     // Label -> address
};

class Emitter {
public:
    virtual ~Emitter() = default;

    virtual void add_label(const std::string& file, int line, const std::string& name) = 0;

    virtual void add_directive(const std::string& file, int line, const std::string& name,
                               const std::vector<Operand>& args) = 0;

    // opcode | a
    virtual void add_instruction_j(const std::string& file, int line, Word first,
                                   const Operand& a) = 0;

    // opcode | a | b | c
    virtual void add_instruction_i(const std::string& file, int line, Word first,
                                   const Operand& a, const Operand& b, const Operand& c) = 0;

    // opcode | a | b | c | d | e
    virtual void add_instruction_r(const std::string& file, int line, Word first,
                                   const Operand& a, const Operand& b, const Operand& c,
                                   const Operand& d, const Operand& e) = 0;

    // Finalize. Called once, after everything has been added.
    virtual Image dump() = 0;
};

#endif // EMITTER_HPP
