/**
 * memory.hpp
 *
 * Word-addressed memory for the LC-2K simulator.
 * 65536 signed 32-bit words, zero-initialised.
 */

#ifndef MEMORY_HPP
#define MEMORY_HPP

#include "common.hpp"

class Memory {
public:
    Memory();
    void reset();

    // Word access. Throws MemoryAddressError outside [0, MEMORY_WORDS).
    Word read_word(long long addr) const;
    void write_word(long long addr, Word value);

    // Copy words starting at address 0. Throws RangeError if too large.
    void load_program(const std::vector<Word>& words);

    // Every non-zero word, ascending by address
    std::vector<std::pair<Address, Word>> non_zero_words() const;

private:
    std::vector<Word> mem;

    static void check_address(long long addr);
};

#endif // MEMORY_HPP
