/**
 * overrides.hpp
 *
 * Hooks for mnemonics whose syntax does not fit a single input/output format
 * pair. A hook takes over the parse cursor right after the mnemonic and may
 * consume any tokens and issue any number of emitter requests.
 */

#ifndef OVERRIDES_HPP
#define OVERRIDES_HPP

#include <memory>

#include "common.hpp"

class Parser;

class Override {
public:
    virtual ~Override() = default;
    virtual void parse(Parser& p, const std::string& name) const = 0;
};

class Overrides {
public:
    // LI, LA, JALR, PUSH, POP, JPOP
    static const Overrides& defaults();

    void add(const std::string& name, std::unique_ptr<Override> hook);
    const Override* find(const std::string& name) const;

private:
    std::map<std::string, std::unique_ptr<Override>> hooks;
};

#endif // OVERRIDES_HPP
