/**
 * memory.cpp
 *
 * Implementation of the output image.
 * Runs of bytes in a std::map so ORG can place code anywhere in 4GB
 * without paying per byte. Big-endian byte order.
 */

#include "memory.hpp"

#include <algorithm>
#include <iterator>

// =============================================================================
// Runs
// =============================================================================

void Memory::write(Address addr, const std::vector<Byte>& bytes) {
    if (bytes.empty()) return;

    uint64_t lo = addr;
    uint64_t hi = lo + bytes.size();

    // First run that touches [lo, hi): the one before addr may reach into it
    auto first = runs.upper_bound(addr);
    if (first != runs.begin()) {
        auto prev = std::prev(first);
        if (prev->first + static_cast<uint64_t>(prev->second.size()) >= lo) {
            first = prev;
        }
    }
    auto last = first;
    while (last != runs.end() && last->first <= hi) {
        hi = std::max(hi, last->first + static_cast<uint64_t>(last->second.size()));
        ++last;
    }

    if (first == last) {
        runs.emplace(addr, bytes);
        return;
    }

    // Grow the leading run in place when it starts at or below addr
    if (first->first <= addr) {
        std::vector<Byte>& run = first->second;
        lo = first->first;
        run.resize(static_cast<size_t>(hi - lo), 0);
        for (auto it = std::next(first); it != last; ++it) {
            std::copy(it->second.begin(), it->second.end(), run.begin() + static_cast<size_t>(it->first - lo));
        }
        std::copy(bytes.begin(), bytes.end(), run.begin() + static_cast<size_t>(addr - lo));
        runs.erase(std::next(first), last);
        return;
    }

    std::vector<Byte> merged(static_cast<size_t>(hi - lo), 0);
    for (auto it = first; it != last; ++it) {
        std::copy(it->second.begin(), it->second.end(), merged.begin() + static_cast<size_t>(it->first - lo));
    }
    std::copy(bytes.begin(), bytes.end(), merged.begin());
    runs.erase(first, last);
    runs.emplace(addr, std::move(merged));
}

// =============================================================================
// Byte / Half-Word / Word Access (big-endian)
// =============================================================================

void Memory::write_byte(Address addr, Byte value) {
    write(addr, {value});
}

void Memory::write_half(Address addr, HalfWord value) {
    write(addr, {static_cast<Byte>(value >> 8), static_cast<Byte>(value)});
}

void Memory::write_word(Address addr, Word value) {
    write(addr, {static_cast<Byte>(value >> 24), static_cast<Byte>(value >> 16),
                 static_cast<Byte>(value >> 8), static_cast<Byte>(value)});
}

void Memory::fill(Address addr, size_t count, Byte value) {
    write(addr, std::vector<Byte>(count, value));
}

// =============================================================================
// Output
// =============================================================================

Address Memory::lowest() const {
    return runs.empty() ? 0 : runs.begin()->first;
}

Address Memory::highest() const {
    if (runs.empty()) return 0;
    const auto& last = *runs.rbegin();
    return last.first + static_cast<Address>(last.second.size() - 1);
}

std::vector<Byte> Memory::flatten() const {
    std::vector<Byte> out;
    if (runs.empty()) return out;

    Address start = lowest();
    out.resize(static_cast<size_t>(highest() - start) + 1, 0);
    for (const auto& [addr, bytes] : runs) {
        std::copy(bytes.begin(), bytes.end(), out.begin() + (addr - start));
    }
    return out;
}

// =============================================================================
// Display
// =============================================================================

void Memory::dump(std::ostream& os, Address start, const std::vector<Byte>& bytes) {
    for (size_t i = 0; i < bytes.size(); i += 16) {
        Address addr = start + static_cast<Address>(i);
        os << to_hex(addr) << ": ";

        // Hex bytes
        for (size_t j = 0; j < 16; j++) {
            if (i + j < bytes.size()) {
                os << std::hex << std::setfill('0') << std::setw(2)
                   << static_cast<int>(bytes[i + j]) << " ";
            } else {
                os << "   ";
            }
            if (j == 7) os << " ";
        }

        // ASCII
        os << " |";
        for (size_t j = 0; j < 16 && (i + j) < bytes.size(); j++) {
            char c = static_cast<char>(bytes[i + j]);
            os << ((c >= 32 && c < 127) ? c : '.');
        }
        os << "|\n";
    }
    os << std::dec;
}
