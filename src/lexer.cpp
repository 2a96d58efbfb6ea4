/**
 * lexer.cpp
 *
 * Tokenizer implementation. Each call to next() produces exactly one token;
 * position and the include stack live in the lexer between calls.
 */

#include "lexer.hpp"
#include "registers.hpp"
#include <cctype>

namespace {

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

std::string directory_of(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    if (slash == std::string::npos) return "";
    return path.substr(0, slash + 1);
}

} // namespace

Lexer::Lexer(const std::string& source, const std::string& filename,
             const InstructionTable& table)
    : table(table) {
    Frame f;
    f.file = filename;
    f.text = source;
    stack.push_back(std::move(f));
}

std::optional<std::string> Lexer::read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    std::stringstream buf;
    buf << file.rdbuf();
    return buf.str();
}

// =============================================================================
// Character Helpers
// =============================================================================

char Lexer::peek(size_t ahead) const {
    const Frame& f = stack.back();
    size_t p = f.pos + ahead;
    return (p < f.text.size()) ? f.text[p] : '\0';
}

char Lexer::get() {
    Frame& f = stack.back();
    return (f.pos < f.text.size()) ? f.text[f.pos++] : '\0';
}

bool Lexer::at_end() const {
    const Frame& f = stack.back();
    return f.pos >= f.text.size();
}

// Returns true when a block comment crossed a line break
bool Lexer::skip_blank() {
    bool crossed = false;
    while (!at_end()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\r') {
            get();
        } else if (c == ';' || (c == '/' && peek(1) == '/')) {
            while (!at_end() && peek() != '\n') get();
        } else if (c == '/' && peek(1) == '*') {
            get();
            get();
            while (!at_end() && !(peek() == '*' && peek(1) == '/')) {
                if (get() == '\n') {
                    stack.back().line++;
                    crossed = true;
                }
            }
            if (at_end()) throw error("unterminated block comment");
            get();
            get();
        } else {
            break;
        }
    }
    return crossed;
}

Token Lexer::make(TokenType type) const {
    Token t;
    t.type = type;
    t.file = stack.back().file;
    t.line = stack.back().line;
    return t;
}

AsmError Lexer::error(const std::string& msg) const {
    return AsmError(stack.back().file, stack.back().line, msg);
}

// =============================================================================
// Token Builders
// =============================================================================

std::string Lexer::read_identifier() {
    if (!is_ident_start(peek())) {
        throw error("expected a name");
    }
    std::string name;
    while (is_ident_char(peek())) name += get();
    return name;
}

Token Lexer::lex_number(bool negative) {
    Token t = make(TokenType::NUM);

    int base = 10;
    if (peek() == '$') {
        get();
        base = 16;
    } else if (peek() == '%') {
        get();
        base = 2;
    } else if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'X')) {
        get(); get();
        base = 16;
    } else if (peek() == '0' && (peek(1) == 'b' || peek(1) == 'B')) {
        get(); get();
        base = 2;
    } else if (peek() == '0' && (peek(1) == 'o' || peek(1) == 'O')) {
        get(); get();
        base = 8;
    }

    Value v = 0;
    size_t digits = 0;
    while (true) {
        char c = peek();
        int d;
        if (c >= '0' && c <= '9') d = c - '0';
        else if (c >= 'a' && c <= 'f') d = c - 'a' + 10;
        else if (c >= 'A' && c <= 'F') d = c - 'A' + 10;
        else break;
        if (d >= base) break;

        if (v > (std::numeric_limits<Value>::max() - d) / base) {
            throw error("number too large");
        }
        v = v * base + d;
        get();
        digits++;
    }

    if (digits == 0 || is_ident_char(peek())) {
        throw error("malformed number");
    }

    t.number = negative ? -v : v;
    return t;
}

Token Lexer::lex_string() {
    Token t = make(TokenType::STRING);
    get();  // opening quote

    while (true) {
        if (at_end() || peek() == '\n') {
            throw error("unterminated string");
        }
        char c = get();
        if (c == '"') break;
        if (c == '\\') {
            char e = get();
            switch (e) {
                case 'n': c = '\n'; break;
                case 't': c = '\t'; break;
                case 'r': c = '\r'; break;
                case '0': c = '\0'; break;
                case '\\': c = '\\'; break;
                case '"': c = '"'; break;
                case '\'': c = '\''; break;
                default: throw error(std::string("unknown escape sequence \\") + e);
            }
        }
        t.bytes.push_back(static_cast<Byte>(c));
        t.text += c;
    }
    return t;
}

Token Lexer::lex_deref() {
    Token t = make(TokenType::DEREF);
    get();  // (
    while (peek() == ' ' || peek() == '\t') get();
    std::string name = to_upper(read_identifier());
    while (peek() == ' ' || peek() == '\t') get();
    if (get() != ')') {
        throw error("expected ')' after dereferenced register");
    }
    if (!Registers::is_register(name)) {
        throw error("expected register to dereference");
    }
    t.text = name;
    return t;
}

Token Lexer::lex_define() {
    Token t = make(TokenType::DEF);
    get();  // [
    t.text = read_identifier();
    if (get() != ']' || get() != ':') {
        throw error("malformed define, expected [name]:");
    }
    return t;
}

Token Lexer::lex_directive() {
    Token t = make(TokenType::DIR);
    get();  // .
    t.text = to_upper(read_identifier());

    if (t.text == "INC") {
        if (skip_blank() || peek() != '"') {
            throw error("expected string");
        }
        Token path = lex_string();
        include(path.text);
    }
    return t;
}

Token Lexer::lex_relative() {
    char dir = get();
    Value count = 1;
    while (peek() == dir) {
        get();
        count++;
    }

    if (peek() == ':') {
        get();
        Token t = make(TokenType::RELLABEL);
        t.text = std::string(1, dir);
        return t;
    }

    Token t = make(TokenType::RELLABELSYM);
    t.text = std::string(1, dir);
    t.number = (dir == '+') ? count : -count;
    return t;
}

Token Lexer::lex_word() {
    Token t = make(TokenType::LABELSYM);
    std::string name = read_identifier();

    if (peek() == ':') {
        // A register name is lexed as REG everywhere else, so it could never be referenced
        if (Registers::is_register(to_upper(name))) {
            throw error("label name '" + name + "' is a register");
        }
        get();
        t.type = TokenType::LABEL;
        t.text = name;
        return t;
    }

    std::string upper = to_upper(name);
    if (line_start && table.contains(upper)) {
        t.type = TokenType::INSTR;
        t.text = upper;
    } else if (Registers::is_register(upper)) {
        t.type = TokenType::REG;
        t.text = upper;
    } else {
        t.text = name;
    }
    line_start = false;
    return t;
}

void Lexer::include(const std::string& name) {
    if (stack.size() >= MAX_INCLUDE_DEPTH) {
        throw error("include nesting too deep");
    }

    std::string path = name;
    if (path.empty() || (path[0] != '/' && path[0] != '\\')) {
        path = directory_of(stack.back().file) + name;
    }

    auto text = read_file(path);
    if (!text) {
        throw error("could not open include file '" + name + "'");
    }

    Frame f;
    f.file = path;
    f.text = *text;
    stack.push_back(std::move(f));
    line_start = true;
}

// =============================================================================
// Next Token
// =============================================================================

bool Lexer::next(Token& out) {
    if (stack.empty()) return false;

    bool crossed = skip_blank();

    // A block comment spanning lines ends the statement before it
    if (crossed && !line_start) {
        out = make(TokenType::EOL);
        line_start = true;
        return true;
    }

    if (at_end()) {
        out = make(TokenType::END_OF_FILE);
        stack.pop_back();
        line_start = true;
        return true;
    }

    char c = peek();

    if (c == '\n') {
        out = make(TokenType::EOL);
        get();
        stack.back().line++;
        line_start = true;
        return true;
    }

    if (c == ',') {
        out = make(TokenType::SEP);
        out.text = ",";
        get();
    } else if (c == '"') {
        out = lex_string();
    } else if (c == '(') {
        out = lex_deref();
    } else if (c == '[') {
        out = lex_define();
    } else if (c == '@') {
        get();
        out = make(TokenType::DEFSYM);
        out.text = read_identifier();
    } else if (c == '.' && is_ident_start(peek(1))) {
        line_start = false;
        out = lex_directive();
    } else if (c == '-' && (is_digit(peek(1)) || peek(1) == '$')) {
        get();
        out = lex_number(true);
    } else if (c == '+' || c == '-') {
        out = lex_relative();
    } else if (is_digit(c) || c == '$' || c == '%') {
        out = lex_number(false);
    } else if (is_ident_start(c)) {
        out = lex_word();
    } else {
        throw error(std::string("unexpected character '") + c + "'");
    }
    return true;
}
