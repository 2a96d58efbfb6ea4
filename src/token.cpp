/**
 * token.cpp
 *
 * Vector-backed token source.
 */

#include "token.hpp"

TokenList::TokenList(std::vector<Token> tokens) : tokens(std::move(tokens)) {}

bool TokenList::next(Token& out) {
    if (pos >= tokens.size()) return false;
    out = tokens[pos++];
    return true;
}
