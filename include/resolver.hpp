/**
 * resolver.hpp
 *
 * Token buffering and symbol resolution ahead of parsing.
 * Pass 1 (collect): drain the token source, record defines and the positions
 * of anonymous relative labels.
 * Pass 2 (resolve): produce a new token sequence in which define references
 * are numbers and relative labels are ordinary labels.
 *
 * Labels are not resolved here: instruction sizes may depend on a define's
 * value, but never on a label's address, so two linear passes suffice.
 */

#ifndef RESOLVER_HPP
#define RESOLVER_HPP

#include <deque>

#include "common.hpp"
#include "token.hpp"

class Resolver {
public:
    struct Collected {
        std::vector<Token> tokens;
        std::map<std::string, Value> defines;
        std::vector<size_t> forward_anchors;    // '+' positions, ascending
        std::deque<size_t> backward_anchors;    // '-' positions, newest first
    };

    // Pass 1. Stops after the END_OF_FILE of main_file.
    static Collected collect(TokenSource& source, const std::string& main_file);

    // Pass 2
    static std::vector<Token> resolve(const Collected& collected);

    // Both passes
    static std::vector<Token> run(TokenSource& source, const std::string& main_file);

    // Label name given to the anchor at a buffer position. User labels
    // cannot start with a digit, so these never collide.
    static std::string anchor_name(size_t position);

private:
    static std::optional<size_t> find_anchor(const Collected& collected, size_t position,
                                             Value count);
};

#endif // RESOLVER_HPP
