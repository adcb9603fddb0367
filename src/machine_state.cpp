/**
 * machine_state.cpp
 */

#include "machine_state.hpp"

MachineState::MachineState() : pc(0) {}

MachineState::MachineState(const std::vector<Word>& program) : pc(0) {
    mem.load_program(program);
}

void MachineState::reset() {
    regs.reset();
    mem.reset();
    pc = 0;
}

void MachineState::load_program(const std::vector<Word>& program) {
    reset();
    mem.load_program(program);
}

Word MachineState::read(int reg) const { return regs.read(reg); }
void MachineState::write(int reg, Word value) { regs.write(reg, value); }

Word MachineState::load(long long addr) const { return mem.read_word(addr); }
void MachineState::store(long long addr, Word value) { mem.write_word(addr, value); }

Address MachineState::get_pc() const { return pc; }
void MachineState::set_pc(Address addr) { pc = addr; }

const RegisterFile& MachineState::registers() const { return regs; }
const Memory& MachineState::memory() const { return mem; }
