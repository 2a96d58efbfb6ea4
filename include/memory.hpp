/**
 * memory.hpp
 *
 * Output image under construction.
 * Byte-addressable, big-endian. Written bytes are kept as contiguous runs
 * keyed by start address; touching or overlapping runs are merged.
 */

#ifndef MEMORY_HPP
#define MEMORY_HPP

#include "common.hpp"

class Memory {
public:
    // Byte access
    void write_byte(Address addr, Byte value);

    // Half-word access (16-bit)
    void write_half(Address addr, HalfWord value);

    // Word access (32-bit)
    void write_word(Address addr, Word value);

    void fill(Address addr, size_t count, Byte value);

    // Later writes overwrite earlier ones
    void write(Address addr, const std::vector<Byte>& bytes);

    // Contiguous copy from the lowest written address, gaps zero-filled
    std::vector<Byte> flatten() const;
    Address lowest() const;
    Address highest() const;

    bool empty() const { return runs.empty(); }

    // Display
    static void dump(std::ostream& os, Address start, const std::vector<Byte>& bytes);

private:
    std::map<Address, std::vector<Byte>> runs;
};

#endif // MEMORY_HPP
