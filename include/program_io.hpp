/**
 * program_io.hpp
 *
 * Machine-code file format (one decimal word per line), source file
 * reading, and report rendering.
 */

#ifndef PROGRAM_IO_HPP
#define PROGRAM_IO_HPP

#include "common.hpp"
#include "simulator.hpp"

class ProgramIO {
public:
    // Parse machine code. Values in [-2^31, 2^32) are accepted; unsigned values
    // are reinterpreted as two's complement. Blank lines are skipped.
    // Throws FormatError on a bad line, RangeError if the program exceeds memory.
    static std::vector<Word> read_machine_code(std::istream& in);
    static std::vector<Word> read_machine_code_file(const std::string& filename);

    static void write_machine_code(std::ostream& out, const std::vector<Word>& words);
    static void write_machine_code_file(const std::string& filename,
                                        const std::vector<Word>& words);

    // Throws IoError if the file cannot be opened
    static std::string read_text_file(const std::string& filename);

    static void print_report(std::ostream& out, const Simulator::Report& report);

private:
    static std::string trim(const std::string& s);
    static bool is_integer(const std::string& s);
};

#endif // PROGRAM_IO_HPP
