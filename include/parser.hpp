/**
 * parser.hpp
 *
 * Assembly parser. Resolves the token stream, then walks it line by line:
 * directives, labels and instructions become emitter requests.
 */

#ifndef PARSER_HPP
#define PARSER_HPP

#include "common.hpp"
#include "emitter.hpp"
#include "errors.hpp"
#include "instructions.hpp"
#include "overrides.hpp"
#include "registers.hpp"
#include "token.hpp"

class Parser {
public:
    Parser(Emitter& out, const std::string& main_file,
           const InstructionTable& table = InstructionTable::mips(),
           const Overrides& overrides = Overrides::defaults());

    // Run both resolution passes and the parse loop, then dump the emitter
    Image parse(TokenSource& source);

    // Cursor
    const Token& current() const;
    TokenType type() const { return current().type; }
    void advance();
    bool is_eol() const { return current().is_eol(); }
    void expect_eol();
    bool optional_comma();

    // Operands
    Value number();
    std::vector<Byte> string();
    int reg(RegisterClass cls = RegisterClass::GENERAL);
    int deref();
    Operand constant(bool relative = false, bool no_label = false);

    // Generic format engine
    Args format_in(const InstructionDef& def);
    void format_out(const InstructionDef& def, const Args& args);
    void format_out(const std::string& mnemonic, const Args& args);

    // Error at the current token
    AsmError error(const std::string& msg) const;

private:
    Emitter& out;
    std::string main_file;
    const InstructionTable& table;
    const Overrides& overrides;

    std::vector<Token> tokens;
    size_t pos = 0;

    // Position of the directive or instruction being parsed
    std::string stmt_file;
    int stmt_line = 0;

    void mark_statement();
    void directive();
    void instruction();
    void address_form(const InstructionDef& def);
    void add_directive(const std::string& name, const std::vector<Operand>& args);
};

#endif // PARSER_HPP
