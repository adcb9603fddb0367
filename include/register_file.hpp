/**
 * register_file.hpp
 *
 * 8 general-purpose registers (r0-r7).
 * r0 is hardwired to zero.
 */

#ifndef REGISTER_FILE_HPP
#define REGISTER_FILE_HPP

#include "common.hpp"

class RegisterFile {
public:
    RegisterFile();
    void reset();

    // Read register value
    Word read(int reg) const;

    // Write register value (writes to r0 are ignored)
    void write(int reg, Word value);

    // Display
    void dump(std::ostream& out) const;

    // Direct access for reporting
    const std::array<Word, NUM_REGISTERS>& get_all() const;

private:
    std::array<Word, NUM_REGISTERS> regs;
};

#endif // REGISTER_FILE_HPP
