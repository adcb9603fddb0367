#include <gtest/gtest.h>

#include "decoder.hpp"
#include "encoder.hpp"
#include "errors.hpp"

TEST(EncoderTest, EncodesRFormat) {
    EXPECT_EQ(Encoder::encode(Opcode::ADD, 1, 2, 3), 655363);
    EXPECT_EQ(Encoder::encode(Opcode::NAND, 1, 2, 3), 4849667);
}

TEST(EncoderTest, EncodesIFormat) {
    EXPECT_EQ(Encoder::encode(Opcode::LW, 0, 1, 6), 8454150);
    EXPECT_EQ(Encoder::encode(Opcode::SW, 0, 1, 5), 12648453);
    // Negative offsets keep only the low 16 bits
    EXPECT_EQ(Encoder::encode(Opcode::BEQ, 0, 0, -3), 16842749);
    EXPECT_EQ(Encoder::encode(Opcode::BEQ, 0, 0, -32768), 16777216 + 0x8000);
}

TEST(EncoderTest, EncodesJAndOFormats) {
    EXPECT_EQ(Encoder::encode(Opcode::JALR, 1, 2, 0), 21626880);
    EXPECT_EQ(Encoder::encode(Opcode::HALT, 0, 0, 0), 25165824);
    EXPECT_EQ(Encoder::encode(Opcode::NOOP, 0, 0, 0), 29360128);
}

TEST(EncoderTest, HaltAndNoopIgnoreOperands) {
    EXPECT_EQ(Encoder::encode(Opcode::HALT, 7, 7, 1234), 25165824);
    EXPECT_EQ(Encoder::encode(Opcode::NOOP, 3, 9, -1), 29360128);
}

TEST(EncoderTest, RejectsBadRegisters) {
    EXPECT_THROW(Encoder::encode(Opcode::ADD, 8, 0, 0), RangeError);
    EXPECT_THROW(Encoder::encode(Opcode::ADD, 0, -1, 0), RangeError);
    EXPECT_THROW(Encoder::encode(Opcode::NAND, 0, 0, 8), RangeError);
    EXPECT_THROW(Encoder::encode(Opcode::JALR, 0, 8, 0), RangeError);
    EXPECT_THROW(Encoder::encode(Opcode::LW, 10, 0, 0), RangeError);
}

TEST(EncoderTest, RejectsOffsetsOutside16Bits) {
    EXPECT_NO_THROW(Encoder::encode(Opcode::LW, 0, 0, 32767));
    EXPECT_THROW(Encoder::encode(Opcode::LW, 0, 0, 32768), RangeError);
    EXPECT_THROW(Encoder::encode(Opcode::BEQ, 0, 0, -32769), RangeError);
}

TEST(EncoderTest, DecodeReversesEncode) {
    Instruction add = Decoder::decode(Encoder::encode(Opcode::ADD, 3, 4, 5));
    EXPECT_EQ(add.opcode, Opcode::ADD);
    EXPECT_EQ(add.reg_a, 3);
    EXPECT_EQ(add.reg_b, 4);
    EXPECT_EQ(add.dest, 5);

    Instruction beq = Decoder::decode(Encoder::encode(Opcode::BEQ, 7, 6, -200));
    EXPECT_EQ(beq.opcode, Opcode::BEQ);
    EXPECT_EQ(beq.reg_a, 7);
    EXPECT_EQ(beq.reg_b, 6);
    EXPECT_EQ(beq.offset, -200);

    Instruction jalr = Decoder::decode(Encoder::encode(Opcode::JALR, 2, 2, 0));
    EXPECT_EQ(jalr.opcode, Opcode::JALR);
    EXPECT_EQ(jalr.reg_a, 2);
    EXPECT_EQ(jalr.reg_b, 2);
}

TEST(DecoderTest, DisassemblesInstructions) {
    EXPECT_EQ(Decoder::decode(655363).text, "add 1 2 3");
    EXPECT_EQ(Decoder::decode(16842749).text, "beq 0 0 -3");
    EXPECT_EQ(Decoder::decode(21626880).text, "jalr 1 2");
    EXPECT_EQ(Decoder::decode(25165824).text, "halt");
}

TEST(DecoderTest, HighBitsMakeWordInvalid) {
    Instruction ins = Decoder::decode(-1);
    EXPECT_EQ(ins.opcode, Opcode::INVALID);
    EXPECT_EQ(ins.format, Format::UNKNOWN);
    EXPECT_EQ(ins.text, ".fill -1");

    EXPECT_EQ(Decoder::decode(1 << 25).opcode, Opcode::INVALID);
}
