/**
 * sim_main.cpp
 *
 * Entry point for the simulator.
 * Usage: lc2k-sim [program.mc] [--quiet] [--log FILE] [--max-steps N]
 *
 * The per-step trace and the final report always go to the log file
 * (result.txt by default) and, unless --quiet, to stdout as well.
 */

#include "simulator.hpp"
#include "program_io.hpp"

namespace {

// Writes everything to two stream buffers
class TeeBuf : public std::streambuf {
public:
    TeeBuf(std::streambuf* a, std::streambuf* b) : first(a), second(b) {}

protected:
    int overflow(int c) override {
        if (c == traits_type::eof()) return traits_type::not_eof(c);
        char ch = traits_type::to_char_type(c);
        if (first->sputc(ch) == traits_type::eof()) return traits_type::eof();
        if (second && second->sputc(ch) == traits_type::eof()) return traits_type::eof();
        return c;
    }

    int sync() override {
        int r = first->pubsync();
        if (second && second->pubsync() != 0) r = -1;
        return r;
    }

private:
    std::streambuf* first;
    std::streambuf* second;
};

void usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " [program.mc] [--quiet] [--log FILE] [--max-steps N]\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string program = "output.mc";
    std::string log_file = "result.txt";
    bool quiet = false;
    uint64_t max_steps = 1000000;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--quiet" || arg == "-q") {
            quiet = true;
        } else if (arg == "--log" && i + 1 < argc) {
            log_file = argv[++i];
        } else if (arg == "--max-steps" && i + 1 < argc) {
            std::string n = argv[++i];
            if (n.empty() || n.find_first_not_of("0123456789") != std::string::npos) {
                std::cerr << "Invalid step count: " << n << "\n";
                return 1;
            }
            try {
                max_steps = std::stoull(n);
            } catch (const std::out_of_range&) {
                std::cerr << "Invalid step count: " << n << "\n";
                return 1;
            }
        } else if (!arg.empty() && arg[0] != '-') {
            program = arg;
        } else {
            usage(argv[0]);
            return 1;
        }
    }

    std::vector<Word> words;
    try {
        words = ProgramIO::read_machine_code_file(program);
    } catch (const Lc2kError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    std::ofstream log(log_file);
    if (!log.is_open()) {
        std::cerr << "Cannot write file: " << log_file << "\n";
        return 1;
    }

    TeeBuf tee(log.rdbuf(), quiet ? nullptr : std::cout.rdbuf());
    std::ostream out(&tee);

    Simulator::Config config;
    config.max_steps = max_steps;
    config.record_log = false;
    config.trace = &out;

    Simulator sim(words, config);
    Simulator::Report report = sim.run();

    ProgramIO::print_report(out, report);
    out.flush();
    log.close();
    if (!out || !log) {
        std::cerr << "Write failed: " << log_file << "\n";
        return 1;
    }

    if (report.state != Simulator::State::HALTED) {
        std::cerr << "Simulation stopped: " << state_name(report.state);
        if (report.state == Simulator::State::FAULTED) {
            std::cerr << " (" << error_kind_name(report.fault) << ")";
        }
        std::cerr << "\n";
        return 1;
    }
    return 0;
}
