/**
 * machine_state.hpp
 *
 * Architectural state of the LC-2K machine: register file, memory, and PC.
 */

#ifndef MACHINE_STATE_HPP
#define MACHINE_STATE_HPP

#include "common.hpp"
#include "memory.hpp"
#include "register_file.hpp"

class MachineState {
public:
    MachineState();
    explicit MachineState(const std::vector<Word>& program);

    // Clear registers and memory, PC = 0
    void reset();

    // Reset, then copy program to address 0
    void load_program(const std::vector<Word>& program);

    // Registers (write to r0 is a no-op)
    Word read(int reg) const;
    void write(int reg, Word value);

    // Memory, bounds-checked
    Word load(long long addr) const;
    void store(long long addr, Word value);

    Address get_pc() const;
    void set_pc(Address addr);

    const RegisterFile& registers() const;
    const Memory& memory() const;

private:
    RegisterFile regs;
    Memory mem;
    Address pc;
};

#endif // MACHINE_STATE_HPP
