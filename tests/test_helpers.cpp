/**
 * test_helpers.cpp
 */

#include "test_helpers.hpp"
#include "errors.hpp"
#include "lexer.hpp"
#include "parser.hpp"

#include <gtest/gtest.h>

void RecordingEmitter::add_label(const std::string& file, int line, const std::string& name) {
    Request r;
    r.kind = Request::Kind::LABEL;
    r.file = file;
    r.line = line;
    r.name = name;
    requests.push_back(r);
}

void RecordingEmitter::add_directive(const std::string& file, int line, const std::string& name,
                                     const std::vector<Operand>& args) {
    Request r;
    r.kind = Request::Kind::DIRECTIVE;
    r.file = file;
    r.line = line;
    r.name = name;
    r.args = args;
    requests.push_back(r);
}

void RecordingEmitter::add_instruction_j(const std::string& file, int line, Word first,
                                         const Operand& a) {
    Request r;
    r.kind = Request::Kind::J;
    r.file = file;
    r.line = line;
    r.first = first;
    r.args = {a};
    requests.push_back(r);
}

void RecordingEmitter::add_instruction_i(const std::string& file, int line, Word first,
                                         const Operand& a, const Operand& b, const Operand& c) {
    Request r;
    r.kind = Request::Kind::I;
    r.file = file;
    r.line = line;
    r.first = first;
    r.args = {a, b, c};
    requests.push_back(r);
}

void RecordingEmitter::add_instruction_r(const std::string& file, int line, Word first,
                                         const Operand& a, const Operand& b, const Operand& c,
                                         const Operand& d, const Operand& e) {
    Request r;
    r.kind = Request::Kind::R;
    r.file = file;
    r.line = line;
    r.first = first;
    r.args = {a, b, c, d, e};
    requests.push_back(r);
}

Image RecordingEmitter::dump() {
    dumps++;
    return Image();
}

std::vector<Request> RecordingEmitter::instructions() const {
    std::vector<Request> out;
    for (const auto& r : requests) {
        if (r.is_instruction()) out.push_back(r);
    }
    return out;
}

std::vector<Request> RecordingEmitter::directives() const {
    std::vector<Request> out;
    for (const auto& r : requests) {
        if (r.kind == Request::Kind::DIRECTIVE) out.push_back(r);
    }
    return out;
}

void parse_text(RecordingEmitter& em, const std::string& source, const std::string& file) {
    Lexer lexer(source, file);
    Parser parser(em, file);
    parser.parse(lexer);
}

std::string parse_error(const std::string& source, const std::string& file) {
    RecordingEmitter em;
    try {
        parse_text(em, source, file);
    } catch (const AsmError& e) {
        return e.what();
    } catch (const InternalError& e) {
        return e.what();
    }
    return "";
}

std::vector<Token> lex_all(const std::string& source, const std::string& file) {
    Lexer lexer(source, file);
    std::vector<Token> out;
    Token t;
    while (lexer.next(t)) out.push_back(t);
    return out;
}

Token tok(TokenType type, const std::string& text, Value number, int line,
          const std::string& file) {
    Token t;
    t.type = type;
    t.text = text;
    t.number = number;
    t.line = line;
    t.file = file;
    return t;
}

Token num(Value v, int line) {
    return tok(TokenType::NUM, "", v, line);
}

Token eof(const std::string& file, int line) {
    return tok(TokenType::END_OF_FILE, "", 0, line, file);
}

Word word_at(const Assembler::Result& res, size_t i) {
    size_t p = i * 4;
    if (p + 4 > res.bytes.size()) {
        ADD_FAILURE() << "no word " << i << " in " << res.bytes.size() << " bytes";
        return 0;
    }
    return (static_cast<Word>(res.bytes[p]) << 24) |
           (static_cast<Word>(res.bytes[p + 1]) << 16) |
           (static_cast<Word>(res.bytes[p + 2]) << 8) |
           static_cast<Word>(res.bytes[p + 3]);
}

std::string write_temp(const std::string& name, const std::string& content) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream file(path, std::ios::binary);
    file << content;
    return path;
}
