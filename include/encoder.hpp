/**
 * encoder.hpp
 *
 * Instruction encoder.
 * Packs an opcode and its operand fields into one 32-bit machine word.
 */

#ifndef ENCODER_HPP
#define ENCODER_HPP

#include "common.hpp"

class Encoder {
public:
    // Encode one instruction. dest_or_offset is the destination register
    // for add/nand, the 16-bit offset for lw/sw/beq, and ignored otherwise.
    // Throws RangeError on a bad register or offset.
    static Word encode(Opcode op, int reg_a, int reg_b, int dest_or_offset);

private:
    static Word enc_r(Opcode op, int reg_a, int reg_b, int dest);
    static Word enc_i(Opcode op, int reg_a, int reg_b, int offset);
    static Word enc_j(Opcode op, int reg_a, int reg_b);
    static Word enc_o(Opcode op);

    static void check_reg(int reg, const char* field);
};

#endif // ENCODER_HPP
