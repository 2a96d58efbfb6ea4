/**
 * lexer.hpp
 *
 * Default token source. Turns assembly text into tokens one at a time,
 * splicing in files named by .inc directives.
 *
 * Syntax summary:
 *   ; or //  comment to end of line, slash-star block comments
 *   name:    label            +: / -:  anonymous relative label
 *   +, ++, - relative label references (count = run length)
 *   [name]:  define           @name    define reference
 *   .dir     directive        (reg)    dereferenced register
 *   123 -5 0x1F $1F 0b101 %101 0o17    numbers
 *   "text"   string with \n \t \r \0 \\ \" \' escapes
 */

#ifndef LEXER_HPP
#define LEXER_HPP

#include "common.hpp"
#include "errors.hpp"
#include "token.hpp"
#include "instructions.hpp"

class Lexer : public TokenSource {
public:
    static constexpr size_t MAX_INCLUDE_DEPTH = 32;

    Lexer(const std::string& source, const std::string& filename,
          const InstructionTable& table = InstructionTable::mips());

    bool next(Token& out) override;

    // Whole file contents, or nothing if it cannot be read
    static std::optional<std::string> read_file(const std::string& path);

private:
    struct Frame {
        std::string file;
        std::string text;
        size_t pos = 0;
        int line = 1;
    };

    const InstructionTable& table;
    std::vector<Frame> stack;
    bool line_start = true;     // no instruction seen yet on this line

    // Character helpers
    char peek(size_t ahead = 0) const;
    char get();
    bool at_end() const;
    bool skip_blank();

    // Token builders
    Token make(TokenType type) const;
    Token lex_number(bool negative);
    Token lex_string();
    Token lex_deref();
    Token lex_define();
    Token lex_directive();
    Token lex_relative();
    Token lex_word();
    std::string read_identifier();
    void include(const std::string& name);

    AsmError error(const std::string& msg) const;
};

#endif // LEXER_HPP
