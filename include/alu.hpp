/**
 * alu.hpp
 *
 * Arithmetic Logic Unit.
 * LC-2K only needs add, nand, the beq equality test, and the
 * base + offset address calculation.
 */

#ifndef ALU_HPP
#define ALU_HPP

#include "common.hpp"

class ALU {
public:
    // Execute add or nand with 32-bit wrap-around
    static Word execute(Opcode op, Word a, Word b);

    // Evaluate beq condition
    static bool branch_taken(Word a, Word b);

    // base + offset without overflow, so out-of-range results stay visible
    static long long effective_address(Word base, Word offset);
};

#endif // ALU_HPP
