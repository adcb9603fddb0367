/**
 * executor.cpp
 *
 * Instruction semantics. All reads and bounds checks happen before
 * any register, memory, or PC write.
 */

#include "executor.hpp"
#include "alu.hpp"
#include "decoder.hpp"

// =============================================================================
// Faults
// =============================================================================

StepResult Executor::pc_fault(long long target) {
    return StepResult::make_fault(ErrorKind::PC_OUT_OF_BOUNDS,
                                  "pc out of bounds: " + std::to_string(target));
}

StepResult Executor::mem_fault(long long addr) {
    return StepResult::make_fault(ErrorKind::MEMORY_OUT_OF_BOUNDS,
                                  "memory address out of bounds: " + std::to_string(addr));
}

// =============================================================================
// add / nand
// =============================================================================

StepResult Executor::exec_alu(const Instruction& ins, MachineState& state) {
    Word a = state.read(ins.reg_a);
    Word b = state.read(ins.reg_b);
    state.write(ins.dest, ALU::execute(ins.opcode, a, b));
    state.set_pc(state.get_pc() + 1);
    return StepResult::make_continue();
}

// =============================================================================
// lw / sw
// =============================================================================

StepResult Executor::exec_load(const Instruction& ins, MachineState& state) {
    long long addr = ALU::effective_address(state.read(ins.reg_a), ins.offset);
    if (!valid_address(addr)) return mem_fault(addr);

    state.write(ins.reg_b, state.load(addr));
    state.set_pc(state.get_pc() + 1);
    return StepResult::make_continue();
}

StepResult Executor::exec_store(const Instruction& ins, MachineState& state) {
    long long addr = ALU::effective_address(state.read(ins.reg_a), ins.offset);
    if (!valid_address(addr)) return mem_fault(addr);

    state.store(addr, state.read(ins.reg_b));
    state.set_pc(state.get_pc() + 1);
    return StepResult::make_continue();
}

// =============================================================================
// beq / jalr
// =============================================================================

StepResult Executor::exec_beq(const Instruction& ins, MachineState& state) {
    long long next_pc = static_cast<long long>(state.get_pc()) + 1;
    if (ALU::branch_taken(state.read(ins.reg_a), state.read(ins.reg_b))) {
        next_pc += ins.offset;
    }
    if (!valid_address(next_pc)) return pc_fault(next_pc);

    state.set_pc(static_cast<Address>(next_pc));
    return StepResult::make_continue();
}

StepResult Executor::exec_jalr(const Instruction& ins, MachineState& state) {
    // Target is read before the link write, so jalr r r jumps to the old value
    Word target = state.read(ins.reg_a);
    if (!valid_address(target)) return pc_fault(target);

    state.write(ins.reg_b, state.get_pc() + 1);
    state.set_pc(target);
    return StepResult::make_continue();
}

// =============================================================================
// Dispatch
// =============================================================================

StepResult Executor::execute(const Instruction& ins, MachineState& state) {
    switch (ins.opcode) {
        case Opcode::ADD:
        case Opcode::NAND:
            return exec_alu(ins, state);
        case Opcode::LW:
            return exec_load(ins, state);
        case Opcode::SW:
            return exec_store(ins, state);
        case Opcode::BEQ:
            return exec_beq(ins, state);
        case Opcode::JALR:
            return exec_jalr(ins, state);
        case Opcode::HALT:
            state.set_pc(state.get_pc() + 1);
            return StepResult::make_halted();
        case Opcode::NOOP:
            state.set_pc(state.get_pc() + 1);
            return StepResult::make_continue();
        default:
            break;
    }
    return StepResult::make_fault(ErrorKind::UNKNOWN_OPCODE,
                                  "unknown opcode in word " + std::to_string(ins.raw));
}

StepResult Executor::step(Word word, MachineState& state) {
    return execute(Decoder::decode(word, state.get_pc()), state);
}
