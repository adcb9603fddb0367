/**
 * encoder.cpp
 *
 * Implementation of instruction encoding.
 */

#include "encoder.hpp"
#include "errors.hpp"

// =============================================================================
// Format Helpers
// =============================================================================

Word Encoder::enc_r(Opcode op, int reg_a, int reg_b, int dest) {
    UWord w = (static_cast<UWord>(op) << OPCODE_SHIFT) |
              (static_cast<UWord>(reg_a) << REG_A_SHIFT) |
              (static_cast<UWord>(reg_b) << REG_B_SHIFT) |
              (static_cast<UWord>(dest) & FIELD_MASK);
    return static_cast<Word>(w);
}

Word Encoder::enc_i(Opcode op, int reg_a, int reg_b, int offset) {
    UWord w = (static_cast<UWord>(op) << OPCODE_SHIFT) |
              (static_cast<UWord>(reg_a) << REG_A_SHIFT) |
              (static_cast<UWord>(reg_b) << REG_B_SHIFT) |
              (static_cast<UWord>(offset) & OFFSET_MASK);
    return static_cast<Word>(w);
}

Word Encoder::enc_j(Opcode op, int reg_a, int reg_b) {
    UWord w = (static_cast<UWord>(op) << OPCODE_SHIFT) |
              (static_cast<UWord>(reg_a) << REG_A_SHIFT) |
              (static_cast<UWord>(reg_b) << REG_B_SHIFT);
    return static_cast<Word>(w);
}

Word Encoder::enc_o(Opcode op) {
    return static_cast<Word>(static_cast<UWord>(op) << OPCODE_SHIFT);
}

void Encoder::check_reg(int reg, const char* field) {
    if (!valid_register(reg)) {
        throw RangeError(std::string(field) + " out of range 0..7: " +
                         std::to_string(reg));
    }
}

// =============================================================================
// Encode
// =============================================================================

Word Encoder::encode(Opcode op, int reg_a, int reg_b, int dest_or_offset) {
    switch (op_format(op)) {
        case Format::R:
            check_reg(reg_a, "regA");
            check_reg(reg_b, "regB");
            check_reg(dest_or_offset, "destReg");
            return enc_r(op, reg_a, reg_b, dest_or_offset);

        case Format::I:
            check_reg(reg_a, "regA");
            check_reg(reg_b, "regB");
            if (!fits_signed16(dest_or_offset)) {
                throw RangeError("offset out of 16-bit range: " +
                                 std::to_string(dest_or_offset));
            }
            return enc_i(op, reg_a, reg_b, dest_or_offset);

        case Format::J:
            check_reg(reg_a, "regA");
            check_reg(reg_b, "regB");
            return enc_j(op, reg_a, reg_b);

        case Format::O:
            return enc_o(op);

        default:
            break;
    }
    throw RangeError("cannot encode opcode " +
                     std::to_string(static_cast<int>(op)));
}
