/**
 * common.hpp
 *
 * Shared types, constants, and utility functions used throughout the assembler.
 */

#ifndef COMMON_HPP
#define COMMON_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <stdexcept>
#include <optional>
#include <limits>

// =============================================================================
// Basic Types
// =============================================================================

using Word = uint32_t;          // 32-bit unsigned (one MIPS instruction)
using Address = uint32_t;       // Output address
using Byte = uint8_t;           // 8-bit
using HalfWord = uint16_t;      // 16-bit
using Value = int64_t;          // Literal as written in source (may exceed 32 bits)

constexpr int NUM_REGISTERS = 32;

// Register the assembler reserves for address synthesis (AT)
constexpr int SCRATCH_REGISTER = 1;

// Alignment used by a bare ALIGN directive
constexpr Word DEFAULT_ALIGNMENT = 4;

// =============================================================================
// Utility Functions
// =============================================================================

// True when value can be stored in a signed field of the given width
inline bool fits_signed(Value value, int bits) {
    Value lo = -(Value(1) << (bits - 1));
    Value hi = (Value(1) << (bits - 1)) - 1;
    return value >= lo && value <= hi;
}

// True when value can be stored in an unsigned field of the given width
inline bool fits_unsigned(Value value, int bits) {
    return value >= 0 && value < (Value(1) << bits);
}

// Format as hex string
inline std::string to_hex(Word value, int width = 8) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(width) << value;
    return oss.str();
}

inline std::string to_upper(const std::string& s) {
    std::string r = s;
    for (char& c : r) {
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    }
    return r;
}

#endif // COMMON_HPP
