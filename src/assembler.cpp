/**
 * assembler.cpp
 *
 * Ties the lexer, parser and dumper together and turns failures into
 * Result::errors. Assembly stops at the first error.
 */

#include "assembler.hpp"
#include "dumper.hpp"
#include "errors.hpp"
#include "lexer.hpp"
#include "parser.hpp"

// =============================================================================
// Main Assemble
// =============================================================================

Assembler::Result Assembler::assemble(const std::string& source, const std::string& filename) {
    Result res;

    try {
        Lexer lexer(source, filename);
        Dumper dumper;
        Parser parser(dumper, filename);
        Image img = parser.parse(lexer);

        res.bytes = std::move(img.bytes);
        res.origin = img.origin;
        res.symbols = std::move(img.symbols);
        res.success = true;
    } catch (const AsmError& e) {
        res.errors.push_back(e.what());
    } catch (const InternalError& e) {
        res.errors.push_back(e.what());
    }

    return res;
}

Assembler::Result Assembler::assemble_file(const std::string& filename) {
    auto text = Lexer::read_file(filename);
    if (!text) {
        Result res;
        res.success = false;
        res.errors.push_back("Cannot open file: " + filename);
        return res;
    }
    return assemble(*text, filename);
}

bool Assembler::is_user_symbol(const std::string& name) {
    return !name.empty() && !(name[0] >= '0' && name[0] <= '9');
}
