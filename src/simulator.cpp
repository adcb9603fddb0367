/**
 * simulator.cpp
 *
 * Fetch-decode-execute loop.
 * One instruction per step; the loop stops on halt, fault, or step limit.
 */

#include "simulator.hpp"
#include "decoder.hpp"

Simulator::Simulator(const std::vector<Word>& program)
    : Simulator(program, Config()) {}

Simulator::Simulator(const std::vector<Word>& program, const Config& config)
    : state(program), config(config), run_state(State::RUNNING),
      instructions(0), fault(ErrorKind::NONE) {}

// =============================================================================
// Trace
// =============================================================================

void Simulator::trace_state() const {
    if (!config.trace) return;
    *config.trace << "pc:" << state.get_pc() << "  ";
    state.registers().dump(*config.trace);
    *config.trace << "\n";
}

Simulator::State Simulator::set_fault(ErrorKind kind, const std::string& reason) {
    fault = kind;
    fault_reason = reason;
    run_state = State::FAULTED;
    return run_state;
}

// =============================================================================
// Step (execute one instruction)
// =============================================================================

Simulator::State Simulator::step() {
    if (run_state != State::RUNNING) return run_state;

    Address pc = state.get_pc();
    if (!valid_address(pc)) {
        return set_fault(ErrorKind::PC_OUT_OF_BOUNDS,
                         "pc out of bounds: " + std::to_string(pc));
    }

    if (config.max_steps != 0 && instructions >= config.max_steps) {
        run_state = State::STEP_LIMIT;
        return run_state;
    }

    // Fetch
    Word raw = state.load(pc);

    // Decode
    Instruction ins = Decoder::decode(raw, pc);

    trace_state();
    if (config.record_log) {
        log.push_back({pc, raw, ins.text});
    }

    // Execute
    StepResult res = Executor::execute(ins, state);
    if (res.is_fault()) {
        return set_fault(res.fault, res.reason);
    }

    instructions++;
    if (res.status == StepResult::Status::HALTED) {
        run_state = State::HALTED;
    }
    return run_state;
}

// =============================================================================
// Run
// =============================================================================

Simulator::Report Simulator::run() {
    while (step() == State::RUNNING) {}
    return report();
}

Simulator::Report Simulator::report() const {
    Report rep;
    rep.state = run_state;
    rep.registers = state.registers().get_all();
    rep.pc = state.get_pc();
    rep.instructions = instructions;
    rep.memory = state.memory().non_zero_words();
    rep.fault = fault;
    rep.fault_reason = fault_reason;
    return rep;
}

// =============================================================================
// Accessors
// =============================================================================

Simulator::State Simulator::get_state() const { return run_state; }
const MachineState& Simulator::machine() const { return state; }
const std::vector<Simulator::LogEntry>& Simulator::get_log() const { return log; }
uint64_t Simulator::get_instruction_count() const { return instructions; }
ErrorKind Simulator::get_fault() const { return fault; }
const std::string& Simulator::get_fault_reason() const { return fault_reason; }

std::string state_name(Simulator::State state) {
    switch (state) {
        case Simulator::State::RUNNING:    return "running";
        case Simulator::State::HALTED:     return "halted";
        case Simulator::State::FAULTED:    return "faulted";
        case Simulator::State::STEP_LIMIT: return "step limit";
    }
    return "unknown";
}
