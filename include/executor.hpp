/**
 * executor.hpp
 *
 * Executes one decoded instruction against the machine state:
 * register read, ALU, memory access, writeback, next PC.
 */

#ifndef EXECUTOR_HPP
#define EXECUTOR_HPP

#include "common.hpp"
#include "errors.hpp"
#include "machine_state.hpp"

struct StepResult {
    enum class Status {
        CONTINUE,
        HALTED,
        FAULT
    };

    Status status = Status::CONTINUE;
    ErrorKind fault = ErrorKind::NONE;
    std::string reason;

    static StepResult make_continue() { return {}; }
    static StepResult make_halted() { return {Status::HALTED, ErrorKind::NONE, ""}; }
    static StepResult make_fault(ErrorKind kind, const std::string& why) {
        return {Status::FAULT, kind, why};
    }

    bool is_fault() const { return status == Status::FAULT; }
};

class Executor {
public:
    // Execute word as the instruction at state's PC. A faulting step
    // leaves the state untouched.
    static StepResult step(Word word, MachineState& state);

    // Same, with an already decoded instruction
    static StepResult execute(const Instruction& ins, MachineState& state);

private:
    static StepResult exec_alu(const Instruction& ins, MachineState& state);
    static StepResult exec_load(const Instruction& ins, MachineState& state);
    static StepResult exec_store(const Instruction& ins, MachineState& state);
    static StepResult exec_beq(const Instruction& ins, MachineState& state);
    static StepResult exec_jalr(const Instruction& ins, MachineState& state);

    static StepResult pc_fault(long long target);
    static StepResult mem_fault(long long addr);
};

#endif // EXECUTOR_HPP
