/**
 * assembler.cpp
 *
 * Two-pass assembler implementation.
 * Pass 1: Collect labels
 * Pass 2: Generate machine code
 */

#include "assembler.hpp"
#include "encoder.hpp"
#include "program_io.hpp"
#include <cctype>

// =============================================================================
// String Helpers
// =============================================================================

std::string Assembler::trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string Assembler::strip_comment(const std::string& s) {
    size_t hash = s.find('#');
    return (hash == std::string::npos) ? s : s.substr(0, hash);
}

std::vector<std::string> Assembler::split(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream ss(s);
    std::string tok;
    while (ss >> tok) out.push_back(tok);
    return out;
}

bool Assembler::is_label(const std::string& s) {
    if (s.empty() || s.size() > 6) return false;
    if (!std::isalpha(static_cast<unsigned char>(s[0]))) return false;
    for (char c : s) {
        if (!std::isalnum(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// =============================================================================
// Parsing Helpers
// =============================================================================

// Decimal literal with optional '-'. Throws RangeError on overflow.
bool Assembler::parse_number(const std::string& s, long long& val) {
    size_t i = (!s.empty() && s[0] == '-') ? 1 : 0;
    if (i >= s.size()) return false;
    for (size_t j = i; j < s.size(); j++) {
        if (!std::isdigit(static_cast<unsigned char>(s[j]))) return false;
    }
    try {
        val = std::stoll(s);
    } catch (const std::out_of_range&) {
        throw RangeError("number out of range: " + s);
    }
    return true;
}

int Assembler::parse_reg(const std::string& s) const {
    long long reg;
    if (!parse_number(s, reg)) {
        throw SyntaxError("register must be numeric: '" + s + "'");
    }
    if (!valid_register(reg)) {
        throw RangeError("register out of range 0..7: " + s);
    }
    return static_cast<int>(reg);
}

// Numeric literal or label address
long long Assembler::parse_value(const std::string& s) const {
    long long val;
    if (parse_number(s, val)) return val;
    return labels.resolve(s);
}

Word Assembler::parse_fill(const std::string& s) const {
    long long val = parse_value(s);
    if (val < std::numeric_limits<Word>::min() ||
        val > std::numeric_limits<Word>::max()) {
        throw RangeError(".fill value out of 32-bit range: " + s);
    }
    return static_cast<Word>(val);
}

// beq target: a label is PC-relative, a literal is used as-is
int Assembler::branch_offset(const std::string& s, Address index) const {
    long long val;
    if (!parse_number(s, val)) {
        val = static_cast<long long>(labels.resolve(s)) - (index + 1);
    }
    if (!fits_signed16(val)) {
        throw RangeError("branch offset out of 16-bit range: " +
                         std::to_string(val));
    }
    return static_cast<int>(val);
}

void Assembler::check_operands(const Line& line, size_t expected) {
    if (line.operands.size() != expected) {
        throw SyntaxError(line.mnemonic + " expects " + std::to_string(expected) +
                          " operands, got " + std::to_string(line.operands.size()));
    }
}

// =============================================================================
// Emit
// =============================================================================

void Assembler::emit(Word w, const Line& line) {
    source_map[static_cast<Address>(words_out.size())] = line.source;
    words_out.push_back(w);
}

// =============================================================================
// Pass 1: parse line, define label, validate mnemonic
// =============================================================================

void Assembler::pass1(const std::string& raw, int num) {
    auto tokens = split(strip_comment(raw));
    if (tokens.empty()) return;

    Line line;
    line.line_num = num;
    line.source = trim(raw);

    size_t op_idx = 0;
    if (is_label(tokens[0]) && !parse_opcode(tokens[0])) {
        line.label = tokens[0];
        op_idx = 1;
    }
    if (op_idx >= tokens.size()) {
        throw SyntaxError("missing opcode after label '" + line.label + "'");
    }

    line.mnemonic = tokens[op_idx];
    if (line.mnemonic != ".fill" && !parse_opcode(line.mnemonic)) {
        throw UnknownOpcodeError("unknown opcode '" + line.mnemonic + "'");
    }
    line.operands.assign(tokens.begin() + op_idx + 1, tokens.end());

    if (!line.label.empty()) {
        labels.define(line.label, static_cast<Address>(lines.size()));
    }
    lines.push_back(line);
}

// =============================================================================
// Pass 2: resolve operands and encode
// =============================================================================

void Assembler::pass2(const Line& line, Address index) {
    const auto& ops = line.operands;

    if (line.mnemonic == ".fill") {
        check_operands(line, 1);
        emit(parse_fill(ops[0]), line);
        return;
    }

    Opcode op = *parse_opcode(line.mnemonic);
    Word w = 0;

    switch (op_format(op)) {
        case Format::R:
            check_operands(line, 3);
            w = Encoder::encode(op, parse_reg(ops[0]), parse_reg(ops[1]),
                                parse_reg(ops[2]));
            break;

        case Format::I: {
            check_operands(line, 3);
            int reg_a = parse_reg(ops[0]);
            int reg_b = parse_reg(ops[1]);
            long long offset = (op == Opcode::BEQ) ? branch_offset(ops[2], index)
                                                   : parse_value(ops[2]);
            if (!fits_signed16(offset)) {
                throw RangeError("offset out of 16-bit range: " + ops[2]);
            }
            w = Encoder::encode(op, reg_a, reg_b, static_cast<int>(offset));
            break;
        }

        case Format::J:
            check_operands(line, 2);
            w = Encoder::encode(op, parse_reg(ops[0]), parse_reg(ops[1]), 0);
            break;

        case Format::O:
            check_operands(line, 0);
            w = Encoder::encode(op, 0, 0, 0);
            break;

        default:
            throw UnknownOpcodeError("unknown opcode '" + line.mnemonic + "'");
    }

    emit(w, line);
}

// =============================================================================
// Main Assemble
// =============================================================================

Assembler::Result Assembler::assemble(const std::string& source) {
    Result res;

    // Reset state
    labels.clear();
    lines.clear();
    words_out.clear();
    source_map.clear();

    // Split into lines
    std::vector<std::string> raw_lines;
    std::istringstream ss(source);
    std::string raw;
    while (std::getline(ss, raw)) raw_lines.push_back(raw);

    line_num = 0;
    std::string current;
    try {
        // Pass 1: collect labels
        for (const auto& l : raw_lines) {
            line_num++;
            current = l;
            pass1(l, line_num);
        }

        // Pass 2: generate code
        for (size_t i = 0; i < lines.size(); i++) {
            line_num = lines[i].line_num;
            current = lines[i].source;
            pass2(lines[i], static_cast<Address>(i));
        }
    } catch (const Lc2kError& e) {
        res.success = false;
        res.error_kind = e.kind();
        res.error_line = line_num;
        res.errors.push_back("Line " + std::to_string(line_num) + ": " +
                             e.what() + "\n    " + trim(current));
        res.symbols = labels.get_all();
        return res;
    }

    res.success = true;
    res.words = words_out;
    res.symbols = labels.get_all();
    res.source_map = source_map;
    return res;
}

Assembler::Result Assembler::assemble_file(const std::string& filename) {
    std::string source;
    try {
        source = ProgramIO::read_text_file(filename);
    } catch (const IoError& e) {
        Result res;
        res.success = false;
        res.error_kind = e.kind();
        res.errors.push_back(e.what());
        return res;
    }
    return assemble(source);
}
