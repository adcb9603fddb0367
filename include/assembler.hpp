/**
 * assembler.hpp
 *
 * Two-pass assembler for LC-2K assembly.
 * Pass 1 collects labels and validates mnemonics,
 * pass 2 resolves operands and emits one word per instruction line.
 */

#ifndef ASSEMBLER_HPP
#define ASSEMBLER_HPP

#include "common.hpp"
#include "errors.hpp"
#include "label_table.hpp"

class Assembler {
public:
    // One pre-parsed, non-blank source line
    struct Line {
        int line_num = 0;                   // 1-based source line
        std::string label;                  // Empty if none
        std::string mnemonic;               // Opcode name or ".fill"
        std::vector<std::string> operands;
        std::string source;                 // Original text, for diagnostics
    };

    // Result of assembly
    struct Result {
        bool success = false;
        std::vector<Word> words;                    // Machine code, one per line
        std::map<std::string, Address> symbols;     // Label -> address
        std::map<Address, std::string> source_map;  // Address -> source line
        ErrorKind error_kind = ErrorKind::NONE;
        int error_line = 0;                         // 0 if not tied to a line
        std::vector<std::string> errors;
    };

    // Assemble from string
    Result assemble(const std::string& source);

    // Assemble from file
    Result assemble_file(const std::string& filename);

    // Label syntax: a letter followed by at most five letters or digits
    static bool is_label(const std::string& s);

private:
    // State during assembly
    LabelTable labels;
    std::vector<Line> lines;
    std::vector<Word> words_out;
    std::map<Address, std::string> source_map;
    int line_num = 0;

    // String helpers
    static std::string trim(const std::string& s);
    static std::string strip_comment(const std::string& s);
    static std::vector<std::string> split(const std::string& s);

    // Parsing helpers
    static bool parse_number(const std::string& s, long long& val);
    int parse_reg(const std::string& s) const;
    long long parse_value(const std::string& s) const;
    Word parse_fill(const std::string& s) const;
    int branch_offset(const std::string& s, Address index) const;
    static void check_operands(const Line& line, size_t expected);

    // Passes
    void pass1(const std::string& raw, int num);
    void pass2(const Line& line, Address index);

    // Emit word
    void emit(Word w, const Line& line);
};

#endif // ASSEMBLER_HPP
