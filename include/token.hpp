/**
 * token.hpp
 *
 * Token model shared by the lexer, the resolver and the parser,
 * and the pull interface every token producer implements.
 */

#ifndef TOKEN_HPP
#define TOKEN_HPP

#include "common.hpp"

// =============================================================================
// Token Types
// =============================================================================

enum class TokenType {
    NUM,            // Number literal
    STRING,         // String literal (bytes)
    REG,            // Register name
    DEREF,          // Register in parentheses, e.g. (sp)
    SEP,            // Separator (comma)
    EOL,            // End of line
    END_OF_FILE,    // End of a source file (top-level or included)
    DEF,            // [name]: define keyword, followed by a NUM
    DEFSYM,         // @name define reference
    DIR,            // Directive keyword
    LABEL,          // Label definition
    LABELSYM,       // Label reference
    RELLABEL,       // Anonymous relative label definition (+ or -)
    RELLABELSYM,    // Anonymous relative label reference (signed count)
    INSTR           // Instruction mnemonic
};

// =============================================================================
// Token
// =============================================================================

struct Token {
    TokenType type = TokenType::EOL;

    std::string text;           // Names, directive/register names, separators, anchor direction
    Value number = 0;           // NUM value, or RELLABELSYM signed count
    std::vector<Byte> bytes;    // STRING payload

    std::string file;           // Originating file
    int line = 0;               // 1-based line number

    bool is_eol() const { return type == TokenType::EOL || type == TokenType::END_OF_FILE; }
};

// =============================================================================
// Token Source
// =============================================================================

// Produces one token per call. Returns false once the producer has nothing left;
// a well-behaved source always ends the top-level file with END_OF_FILE first.
class TokenSource {
public:
    virtual ~TokenSource() = default;
    virtual bool next(Token& out) = 0;
};

// Replays a prepared token sequence. Used by tests and tools that lex elsewhere.
class TokenList : public TokenSource {
public:
    explicit TokenList(std::vector<Token> tokens);

    bool next(Token& out) override;

private:
    std::vector<Token> tokens;
    size_t pos = 0;
};

#endif // TOKEN_HPP
