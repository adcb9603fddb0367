/**
 * simulator.hpp
 *
 * Instruction-level LC-2K simulator.
 * Fetches the word at PC, executes it, and repeats until halt or fault.
 */

#ifndef SIMULATOR_HPP
#define SIMULATOR_HPP

#include "common.hpp"
#include "errors.hpp"
#include "executor.hpp"
#include "machine_state.hpp"

class Simulator {
public:
    enum class State {
        RUNNING,
        HALTED,         // halt executed
        FAULTED,        // runtime fault, see fault kind
        STEP_LIMIT      // max_steps reached without halting
    };

    struct Config {
        uint64_t max_steps = 0;         // 0 = unlimited
        bool record_log = true;         // keep per-step LogEntry records
        std::ostream* trace = nullptr;  // per-step register dump
    };

    // One executed step
    struct LogEntry {
        Address pc = 0;
        Word raw = 0;
        std::string text;
    };

    // Final machine state
    struct Report {
        State state = State::RUNNING;
        std::array<Word, NUM_REGISTERS> registers{};
        Address pc = 0;
        uint64_t instructions = 0;
        std::vector<std::pair<Address, Word>> memory;   // non-zero words
        ErrorKind fault = ErrorKind::NONE;
        std::string fault_reason;
    };

    explicit Simulator(const std::vector<Word>& program);
    Simulator(const std::vector<Word>& program, const Config& config);

    // Execute one instruction, returns the resulting state
    State step();

    // Run until halt, fault, or step limit
    Report run();

    Report report() const;

    // State access
    State get_state() const;
    const MachineState& machine() const;
    const std::vector<LogEntry>& get_log() const;
    uint64_t get_instruction_count() const;
    ErrorKind get_fault() const;
    const std::string& get_fault_reason() const;

private:
    MachineState state;
    Config config;
    State run_state;
    uint64_t instructions;
    std::vector<LogEntry> log;
    ErrorKind fault;
    std::string fault_reason;

    void trace_state() const;
    State set_fault(ErrorKind kind, const std::string& reason);
};

std::string state_name(Simulator::State state);

#endif // SIMULATOR_HPP
