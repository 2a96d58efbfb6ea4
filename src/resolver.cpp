/**
 * resolver.cpp
 *
 * Two-pass token preprocessing.
 */

#include "resolver.hpp"
#include "errors.hpp"

// =============================================================================
// Pass 1: Collect
// =============================================================================

Resolver::Collected Resolver::collect(TokenSource& source, const std::string& main_file) {
    Collected c;

    auto pull = [&source](Token& t) {
        if (!source.next(t)) {
            throw InternalError("missing token");
        }
    };

    while (true) {
        Token t;
        pull(t);
        c.tokens.push_back(t);
        size_t pos = c.tokens.size() - 1;

        if (t.type == TokenType::DEF) {
            Token value;
            pull(value);
            c.tokens.push_back(value);
            if (value.type != TokenType::NUM) {
                throw AsmError(t.file, t.line, "expected number for define");
            }
            c.defines[t.text] = value.number;
        } else if (t.type == TokenType::RELLABEL) {
            if (t.text == "+") {
                c.forward_anchors.push_back(pos);
            } else if (t.text == "-") {
                c.backward_anchors.push_front(pos);
            } else {
                throw InternalError("unexpected token for relative label");
            }
        } else if (t.type == TokenType::END_OF_FILE) {
            if (t.file == main_file) break;
        }
    }

    return c;
}

// =============================================================================
// Pass 2: Resolve
// =============================================================================

std::string Resolver::anchor_name(size_t position) {
    return std::to_string(position);
}

std::optional<size_t> Resolver::find_anchor(const Collected& c, size_t position, Value count) {
    Value seen = 0;
    if (count > 0) {
        for (size_t anchor : c.forward_anchors) {
            if (anchor > position && ++seen == count) return anchor;
        }
    } else if (count < 0) {
        for (size_t anchor : c.backward_anchors) {
            if (anchor < position && --seen == count) return anchor;
        }
    }
    return std::nullopt;
}

std::vector<Token> Resolver::resolve(const Collected& c) {
    std::vector<Token> out;
    out.reserve(c.tokens.size());

    for (size_t i = 0; i < c.tokens.size(); i++) {
        Token t = c.tokens[i];

        if (t.type == TokenType::DEFSYM) {
            auto it = c.defines.find(t.text);
            if (it == c.defines.end()) {
                throw AsmError(t.file, t.line, "undefined define");
            }
            t.type = TokenType::NUM;
            t.number = it->second;
        } else if (t.type == TokenType::RELLABEL) {
            t.type = TokenType::LABEL;
            t.text = anchor_name(i);
        } else if (t.type == TokenType::RELLABELSYM) {
            auto anchor = find_anchor(c, i, t.number);
            if (!anchor) {
                throw AsmError(t.file, t.line, "could not find appropriate relative label");
            }
            t.type = TokenType::LABELSYM;
            t.text = anchor_name(*anchor);
        }

        out.push_back(std::move(t));
    }

    return out;
}

std::vector<Token> Resolver::run(TokenSource& source, const std::string& main_file) {
    return resolve(collect(source, main_file));
}
