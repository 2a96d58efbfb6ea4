/**
 * errors.hpp
 *
 * Exception types raised while assembling.
 * AsmError: a fault in the program being assembled (always has a position).
 * InternalError: a fault in the assembler itself (bad table, dispatcher bug).
 */

#ifndef ERRORS_HPP
#define ERRORS_HPP

#include "common.hpp"

class AsmError : public std::runtime_error {
public:
    AsmError(const std::string& file, int line, const std::string& msg)
        : std::runtime_error(file + ":" + std::to_string(line) + ": Error: " + msg),
          file(file), line(line), message(msg) {}

    const std::string file;
    const int line;
    const std::string message;   // Without the position prefix
};

class InternalError : public std::logic_error {
public:
    explicit InternalError(const std::string& msg)
        : std::logic_error("Internal Error: " + msg) {}
};

#endif // ERRORS_HPP
