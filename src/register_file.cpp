/**
 * register_file.cpp
 *
 * Implementation of the 8 general-purpose registers.
 */

#include "register_file.hpp"
#include "errors.hpp"

RegisterFile::RegisterFile() {
    reset();
}

void RegisterFile::reset() {
    regs.fill(0);
}

Word RegisterFile::read(int reg) const {
    if (!valid_register(reg)) {
        throw RangeError("Invalid register: " + std::to_string(reg));
    }
    // r0 always returns 0
    return (reg == 0) ? 0 : regs[reg];
}

void RegisterFile::write(int reg, Word value) {
    if (!valid_register(reg)) {
        throw RangeError("Invalid register: " + std::to_string(reg));
    }
    // Writes to r0 are ignored
    if (reg != 0) {
        regs[reg] = value;
    }
}

void RegisterFile::dump(std::ostream& out) const {
    for (int reg = 0; reg < NUM_REGISTERS; reg++) {
        if (reg > 0) out << " ";
        out << "r" << reg << ":" << regs[reg];
    }
}

const std::array<Word, NUM_REGISTERS>& RegisterFile::get_all() const {
    return regs;
}
