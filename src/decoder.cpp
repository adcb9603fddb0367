/**
 * decoder.cpp
 *
 * Implementation of instruction decoding.
 */

#include "decoder.hpp"

// =============================================================================
// Bit Extraction
// =============================================================================

UWord Decoder::bits(Word val, int hi, int lo) {
    return (static_cast<UWord>(val) >> lo) & ((1U << (hi - lo + 1)) - 1);
}

int Decoder::get_opcode(Word raw) { return static_cast<int>(bits(raw, 24, 22)); }
int Decoder::get_reg_a(Word raw)  { return static_cast<int>(bits(raw, 21, 19)); }
int Decoder::get_reg_b(Word raw)  { return static_cast<int>(bits(raw, 18, 16)); }
int Decoder::get_dest(Word raw)   { return static_cast<int>(bits(raw, 2, 0)); }

Word Decoder::get_offset(Word raw) {
    // offset[15:0] = raw[15:0]
    return sign_extend(bits(raw, 15, 0), 16);
}

// =============================================================================
// Disassembly
// =============================================================================

std::string Decoder::disassemble(const Instruction& ins) {
    std::ostringstream oss;
    std::string name = op_name(ins.opcode);

    switch (ins.format) {
        case Format::R:
            oss << name << " " << ins.reg_a << " " << ins.reg_b << " " << ins.dest;
            break;

        case Format::I:
            oss << name << " " << ins.reg_a << " " << ins.reg_b << " " << ins.offset;
            break;

        case Format::J:
            oss << name << " " << ins.reg_a << " " << ins.reg_b;
            break;

        case Format::O:
            oss << name;
            break;

        default:
            oss << ".fill " << ins.raw;
            break;
    }

    return oss.str();
}

// =============================================================================
// Main Decode Function
// =============================================================================

Instruction Decoder::decode(Word raw, Address pc) {
    Instruction ins;
    ins.raw = raw;
    ins.pc = pc;

    if (static_cast<UWord>(raw) & UNUSED_HIGH_MASK) {
        ins.opcode = Opcode::INVALID;
        ins.format = Format::UNKNOWN;
        ins.text = disassemble(ins);
        return ins;
    }

    ins.opcode = static_cast<Opcode>(get_opcode(raw));
    ins.format = op_format(ins.opcode);

    switch (ins.format) {
        case Format::R:
            ins.reg_a = get_reg_a(raw);
            ins.reg_b = get_reg_b(raw);
            ins.dest = get_dest(raw);
            break;

        case Format::I:
            ins.reg_a = get_reg_a(raw);
            ins.reg_b = get_reg_b(raw);
            ins.offset = get_offset(raw);
            break;

        case Format::J:
            ins.reg_a = get_reg_a(raw);
            ins.reg_b = get_reg_b(raw);
            break;

        default:
            break;
    }

    ins.text = disassemble(ins);
    return ins;
}
