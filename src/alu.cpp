/**
 * alu.cpp
 *
 * Implementation of ALU operations.
 */

#include "alu.hpp"
#include "errors.hpp"

Word ALU::execute(Opcode op, Word a, Word b) {
    UWord ua = static_cast<UWord>(a);
    UWord ub = static_cast<UWord>(b);

    switch (op) {
        case Opcode::ADD:
            return static_cast<Word>(ua + ub);
        case Opcode::NAND:
            return static_cast<Word>(~(ua & ub));
        default:
            break;
    }
    throw UnknownOpcodeError("no ALU operation for " + op_name(op));
}

bool ALU::branch_taken(Word a, Word b) {
    return a == b;
}

long long ALU::effective_address(Word base, Word offset) {
    return static_cast<long long>(base) + static_cast<long long>(offset);
}
