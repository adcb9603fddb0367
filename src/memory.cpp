/**
 * memory.cpp
 *
 * Implementation of the memory subsystem.
 * The full 64K-word space is allocated up front.
 */

#include "memory.hpp"
#include "errors.hpp"
#include <algorithm>

Memory::Memory() : mem(MEMORY_WORDS, 0) {}

void Memory::reset() {
    std::fill(mem.begin(), mem.end(), 0);
}

void Memory::check_address(long long addr) {
    if (!valid_address(addr)) {
        throw MemoryAddressError("memory address out of bounds: " +
                                 std::to_string(addr));
    }
}

// =============================================================================
// Word Access
// =============================================================================

Word Memory::read_word(long long addr) const {
    check_address(addr);
    return mem[static_cast<size_t>(addr)];
}

void Memory::write_word(long long addr, Word value) {
    check_address(addr);
    mem[static_cast<size_t>(addr)] = value;
}

// =============================================================================
// Bulk Operations
// =============================================================================

void Memory::load_program(const std::vector<Word>& words) {
    if (words.size() > mem.size()) {
        throw RangeError("program too big: " + std::to_string(words.size()) +
                         " > " + std::to_string(mem.size()) + " words");
    }
    std::copy(words.begin(), words.end(), mem.begin());
}

std::vector<std::pair<Address, Word>> Memory::non_zero_words() const {
    std::vector<std::pair<Address, Word>> out;
    for (size_t addr = 0; addr < mem.size(); addr++) {
        if (mem[addr] != 0) {
            out.emplace_back(static_cast<Address>(addr), mem[addr]);
        }
    }
    return out;
}
