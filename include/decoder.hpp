/**
 * decoder.hpp
 *
 * Instruction decoder.
 * Takes a 32-bit machine word and extracts all fields
 * and determines the instruction type. Inverse of Encoder.
 */

#ifndef DECODER_HPP
#define DECODER_HPP

#include "common.hpp"

class Decoder {
public:
    // Decode a 32-bit word. Words with any of bits 31..25 set
    // decode as Opcode::INVALID.
    static Instruction decode(Word raw, Address pc = 0);

    // Disassembly generation
    static std::string disassemble(const Instruction& ins);

private:
    // Bit extraction helpers
    static UWord bits(Word val, int hi, int lo);
    static int get_opcode(Word raw);
    static int get_reg_a(Word raw);
    static int get_reg_b(Word raw);
    static int get_dest(Word raw);
    static Word get_offset(Word raw);
};

#endif // DECODER_HPP
