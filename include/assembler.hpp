/**
 * assembler.hpp
 *
 * Front door of the assembler: source text in, big-endian MIPS image out.
 * Lexes, resolves defines and relative labels, parses and dumps.
 */

#ifndef ASSEMBLER_HPP
#define ASSEMBLER_HPP

#include "common.hpp"
#include "emitter.hpp"

class Assembler {
public:
    // Result of assembly
    struct Result {
        bool success = false;
        std::vector<Byte> bytes;                    // Output image
        Address origin = 0;                         // Address of bytes[0]
        std::map<std::string, Address> symbols;     // Label -> address
        std::vector<std::string> errors;
    };

    // Assemble from string; filename is used for diagnostics and includes
    Result assemble(const std::string& source, const std::string& filename = "(string)");

    // Assemble from file
    Result assemble_file(const std::string& filename);

    // True for labels written in the source (not generated for +/- anchors)
    static bool is_user_symbol(const std::string& name);
};

#endif // ASSEMBLER_HPP
