/**
 * program_io.cpp
 */

#include "program_io.hpp"
#include "errors.hpp"
#include <cctype>

// =============================================================================
// Helpers
// =============================================================================

std::string ProgramIO::trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool ProgramIO::is_integer(const std::string& s) {
    size_t i = (!s.empty() && (s[0] == '-' || s[0] == '+')) ? 1 : 0;
    if (i >= s.size()) return false;
    for (; i < s.size(); i++) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// =============================================================================
// Machine Code
// =============================================================================

std::vector<Word> ProgramIO::read_machine_code(std::istream& in) {
    std::vector<Word> words;
    std::string line;
    int line_num = 0;

    while (std::getline(in, line)) {
        line_num++;
        std::string t = trim(line);
        if (t.empty()) continue;

        if (!is_integer(t)) {
            throw FormatError("line " + std::to_string(line_num) +
                              ": not a decimal word: '" + t + "'");
        }

        long long val;
        try {
            val = std::stoll(t);
        } catch (const std::out_of_range&) {
            throw FormatError("line " + std::to_string(line_num) +
                              ": word out of 32-bit range: " + t);
        }
        if (val < std::numeric_limits<Word>::min() ||
            val > static_cast<long long>(std::numeric_limits<UWord>::max())) {
            throw FormatError("line " + std::to_string(line_num) +
                              ": word out of 32-bit range: " + t);
        }

        if (words.size() >= static_cast<size_t>(MEMORY_WORDS)) {
            throw RangeError("program too big: more than " +
                             std::to_string(MEMORY_WORDS) + " words");
        }
        words.push_back(static_cast<Word>(static_cast<UWord>(val)));
    }
    return words;
}

std::vector<Word> ProgramIO::read_machine_code_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw IoError("Cannot open file: " + filename);
    }
    return read_machine_code(file);
}

void ProgramIO::write_machine_code(std::ostream& out, const std::vector<Word>& words) {
    for (Word w : words) {
        out << w << "\n";
    }
}

void ProgramIO::write_machine_code_file(const std::string& filename, const std::vector<Word>& words) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw IoError("Cannot write file: " + filename);
    }
    write_machine_code(file, words);
    if (!file) {
        throw IoError("Write failed: " + filename);
    }
}

std::string ProgramIO::read_text_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw IoError("Cannot open file: " + filename);
    }
    std::stringstream buf;
    buf << file.rdbuf();
    return buf.str();
}

// =============================================================================
// Report
// =============================================================================

void ProgramIO::print_report(std::ostream& out, const Simulator::Report& report) {
    switch (report.state) {
        case Simulator::State::HALTED:
            out << "machine halted\n";
            break;
        case Simulator::State::FAULTED:
            out << "machine faulted at pc " << report.pc << ": "
                << report.fault_reason << "\n";
            break;
        case Simulator::State::STEP_LIMIT:
            out << "step limit " << report.instructions << " exceeded\n";
            break;
        case Simulator::State::RUNNING:
            out << "machine running\n";
            break;
    }

    out << "instructions executed: " << report.instructions << "\n";
    out << "pc:" << report.pc << "  ";
    for (int reg = 0; reg < NUM_REGISTERS; reg++) {
        if (reg > 0) out << " ";
        out << "r" << reg << ":" << report.registers[reg];
    }
    out << "\n";

    out << "--- memory state ---\n";
    for (const auto& [addr, val] : report.memory) {
        out << "mem[" << addr << "] = " << val << "\n";
    }
}
