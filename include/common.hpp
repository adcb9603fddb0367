/**
 * common.hpp
 *
 * Shared types, constants, and utility functions used by the assembler
 * and the simulator.
 */

#ifndef COMMON_HPP
#define COMMON_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <array>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <stdexcept>
#include <optional>
#include <limits>

// =============================================================================
// Basic Types
// =============================================================================

using Word = int32_t;           // 32-bit signed machine word
using UWord = uint32_t;         // Same bits, unsigned (for shifting/masking)
using Address = int32_t;        // Word index into memory

constexpr int NUM_REGISTERS = 8;
constexpr Address MEMORY_WORDS = 1 << 16;   // 65536 words

// =============================================================================
// Instruction Encoding
// =============================================================================

constexpr int OPCODE_SHIFT = 22;
constexpr int REG_A_SHIFT = 19;
constexpr int REG_B_SHIFT = 16;

constexpr UWord FIELD_MASK = 0x7;           // opcode / register fields
constexpr UWord OFFSET_MASK = 0xFFFF;       // I-format offset
constexpr UWord UNUSED_HIGH_MASK = 0xFE000000;  // bits 31..25

constexpr int OFFSET_MIN = -32768;
constexpr int OFFSET_MAX = 32767;

// =============================================================================
// Opcodes
// =============================================================================

enum class Opcode {
    ADD = 0,
    NAND = 1,
    LW = 2,
    SW = 3,
    BEQ = 4,
    JALR = 5,
    HALT = 6,
    NOOP = 7,
    INVALID     // Not an instruction word
};

enum class Format {
    R,      // add, nand
    I,      // lw, sw, beq
    J,      // jalr
    O,      // halt, noop
    UNKNOWN
};

// =============================================================================
// Decoded Instruction
// =============================================================================

struct Instruction {
    Word raw = 0;
    Opcode opcode = Opcode::ADD;
    Format format = Format::R;

    int reg_a = 0;
    int reg_b = 0;
    int dest = 0;               // R-format destination
    Word offset = 0;            // I-format offset (sign-extended)

    Address pc = 0;             // PC where fetched
    std::string text;           // Disassembly string
};

// =============================================================================
// Utility Functions
// =============================================================================

// Sign extend the low `bits` bits of value to 32 bits (bits < 32)
inline Word sign_extend(UWord value, int bits) {
    UWord low_mask = (1U << bits) - 1;
    value &= low_mask;
    if (value & (1U << (bits - 1))) {
        return static_cast<Word>(value | ~low_mask);
    }
    return static_cast<Word>(value);
}

inline bool fits_signed16(long long value) {
    return value >= OFFSET_MIN && value <= OFFSET_MAX;
}

inline bool valid_register(long long reg) {
    return reg >= 0 && reg < NUM_REGISTERS;
}

inline bool valid_address(long long addr) {
    return addr >= 0 && addr < MEMORY_WORDS;
}

// Opcode to mnemonic
inline std::string op_name(Opcode op) {
    switch (op) {
        case Opcode::ADD:  return "add";
        case Opcode::NAND: return "nand";
        case Opcode::LW:   return "lw";
        case Opcode::SW:   return "sw";
        case Opcode::BEQ:  return "beq";
        case Opcode::JALR: return "jalr";
        case Opcode::HALT: return "halt";
        case Opcode::NOOP: return "noop";
        default: return "unknown";
    }
}

inline Format op_format(Opcode op) {
    switch (op) {
        case Opcode::ADD:
        case Opcode::NAND: return Format::R;
        case Opcode::LW:
        case Opcode::SW:
        case Opcode::BEQ:  return Format::I;
        case Opcode::JALR: return Format::J;
        case Opcode::HALT:
        case Opcode::NOOP: return Format::O;
        default: return Format::UNKNOWN;
    }
}

// Mnemonic to opcode (case-sensitive, as in LC-2K sources)
inline std::optional<Opcode> parse_opcode(const std::string& mnem) {
    static const std::map<std::string, Opcode> table = {
        {"add", Opcode::ADD}, {"nand", Opcode::NAND},
        {"lw", Opcode::LW}, {"sw", Opcode::SW},
        {"beq", Opcode::BEQ}, {"jalr", Opcode::JALR},
        {"halt", Opcode::HALT}, {"noop", Opcode::NOOP}
    };
    auto it = table.find(mnem);
    if (it == table.end()) return std::nullopt;
    return it->second;
}

#endif // COMMON_HPP
