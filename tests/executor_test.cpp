#include <gtest/gtest.h>

#include "encoder.hpp"
#include "executor.hpp"

namespace {

Word enc(Opcode op, int a, int b, int c = 0) {
    return Encoder::encode(op, a, b, c);
}

} // namespace

TEST(ExecutorTest, AddWritesDestination) {
    MachineState state;
    state.write(1, 5);
    state.write(2, -7);

    StepResult res = Executor::step(enc(Opcode::ADD, 1, 2, 3), state);
    EXPECT_EQ(res.status, StepResult::Status::CONTINUE);
    EXPECT_EQ(state.read(3), -2);
    EXPECT_EQ(state.get_pc(), 1);
}

TEST(ExecutorTest, AddWrapsAround) {
    MachineState state;
    state.write(1, std::numeric_limits<Word>::max());
    state.write(2, 1);
    Executor::step(enc(Opcode::ADD, 1, 2, 3), state);
    EXPECT_EQ(state.read(3), std::numeric_limits<Word>::min());
}

TEST(ExecutorTest, WriteToRegisterZeroIsDiscarded) {
    MachineState state;
    state.write(1, 3);
    state.write(2, 4);
    Executor::step(enc(Opcode::ADD, 1, 2, 0), state);
    EXPECT_EQ(state.read(0), 0);
    EXPECT_EQ(state.get_pc(), 1);
}

TEST(ExecutorTest, NandComputesBitwiseNand) {
    MachineState state;
    state.write(1, 0x0F0F);
    state.write(2, 0x00FF);
    Executor::step(enc(Opcode::NAND, 1, 2, 4), state);
    EXPECT_EQ(state.read(4), ~(0x0F0F & 0x00FF));
}

TEST(ExecutorTest, LoadAndStoreUseSignExtendedOffset) {
    MachineState state;
    state.write(1, 100);
    state.write(2, 1234);

    Executor::step(enc(Opcode::SW, 1, 2, -10), state);
    EXPECT_EQ(state.load(90), 1234);
    EXPECT_EQ(state.get_pc(), 1);

    Executor::step(enc(Opcode::LW, 1, 5, -10), state);
    EXPECT_EQ(state.read(5), 1234);
    EXPECT_EQ(state.get_pc(), 2);
}

TEST(ExecutorTest, MemoryOutOfBoundsFaults) {
    MachineState state;
    state.write(1, 65535);
    state.write(2, 9);
    state.set_pc(4);

    StepResult sw = Executor::step(enc(Opcode::SW, 1, 2, 1), state);
    EXPECT_TRUE(sw.is_fault());
    EXPECT_EQ(sw.fault, ErrorKind::MEMORY_OUT_OF_BOUNDS);
    EXPECT_EQ(state.get_pc(), 4);

    StepResult lw = Executor::step(enc(Opcode::LW, 0, 3, -1), state);
    EXPECT_EQ(lw.fault, ErrorKind::MEMORY_OUT_OF_BOUNDS);
    EXPECT_EQ(state.read(3), 0);
    EXPECT_EQ(state.get_pc(), 4);
}

TEST(ExecutorTest, BeqTakenJumpsRelativeToNextInstruction) {
    MachineState state;
    state.set_pc(3);
    Executor::step(enc(Opcode::BEQ, 1, 2, 2), state);
    EXPECT_EQ(state.get_pc(), 6);
}

TEST(ExecutorTest, BeqNotTakenFallsThrough) {
    MachineState state;
    state.write(1, 1);
    state.set_pc(3);
    Executor::step(enc(Opcode::BEQ, 1, 2, 2), state);
    EXPECT_EQ(state.get_pc(), 4);
}

TEST(ExecutorTest, BeqOutOfBoundsFaults) {
    MachineState state;
    state.set_pc(2);
    StepResult res = Executor::step(enc(Opcode::BEQ, 0, 0, -5), state);
    EXPECT_EQ(res.fault, ErrorKind::PC_OUT_OF_BOUNDS);
    EXPECT_EQ(state.get_pc(), 2);
}

TEST(ExecutorTest, JalrLinksAndJumps) {
    MachineState state;
    state.write(1, 20);
    state.set_pc(5);
    Executor::step(enc(Opcode::JALR, 1, 2), state);
    EXPECT_EQ(state.read(2), 6);
    EXPECT_EQ(state.get_pc(), 20);
}

TEST(ExecutorTest, JalrSameRegisterJumpsToOldValue) {
    MachineState state;
    state.write(1, 20);
    state.set_pc(5);
    Executor::step(enc(Opcode::JALR, 1, 1), state);
    EXPECT_EQ(state.read(1), 6);
    EXPECT_EQ(state.get_pc(), 20);
}

TEST(ExecutorTest, JalrOutOfBoundsLeavesLinkUnwritten) {
    MachineState state;
    state.write(1, 70000);
    state.set_pc(5);
    StepResult res = Executor::step(enc(Opcode::JALR, 1, 2), state);
    EXPECT_EQ(res.fault, ErrorKind::PC_OUT_OF_BOUNDS);
    EXPECT_EQ(state.read(2), 0);
    EXPECT_EQ(state.get_pc(), 5);
}

TEST(ExecutorTest, HaltAdvancesPcAndStops) {
    MachineState state;
    state.set_pc(7);
    StepResult res = Executor::step(enc(Opcode::HALT, 0, 0), state);
    EXPECT_EQ(res.status, StepResult::Status::HALTED);
    EXPECT_EQ(state.get_pc(), 8);
}

TEST(ExecutorTest, NoopOnlyAdvancesPc) {
    MachineState state;
    state.write(1, 1);
    Executor::step(enc(Opcode::NOOP, 0, 0), state);
    EXPECT_EQ(state.get_pc(), 1);
    EXPECT_EQ(state.read(1), 1);
}

TEST(ExecutorTest, InvalidWordFaults) {
    MachineState state;
    StepResult res = Executor::step(-1, state);
    EXPECT_EQ(res.fault, ErrorKind::UNKNOWN_OPCODE);
    EXPECT_EQ(state.get_pc(), 0);
}
