/**
 * registers.hpp
 *
 * Register name tables: general purpose, floating-point (COP1) and
 * system control (COP0). Names are matched upper-case.
 */

#ifndef REGISTERS_HPP
#define REGISTERS_HPP

#include "common.hpp"

enum class RegisterClass {
    GENERAL,
    FPU,
    SYSTEM
};

class Registers {
public:
    // Register number if name belongs to the class
    static std::optional<int> lookup(RegisterClass cls, const std::string& name);

    // True if name belongs to any register class
    static bool is_register(const std::string& name);

private:
    static const std::map<std::string, int>& table(RegisterClass cls);
};

#endif // REGISTERS_HPP
