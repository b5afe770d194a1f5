#include "gtest/gtest.h"
#include "test_utils.h"
#include "escpos/Command.hpp"

using namespace escpos;

class InstructionTest : public ::testing::Test {
protected:
    std::vector<Command> commands{{0x1B, 0x40}, {0x1B, 0x45, 0x01}};
};

TEST_F(InstructionTest, FlattenConcatenatesInOrder) {
    Instruction instruction("init", commands);
    EXPECT_EQ(instruction.flatten(), test::bytes({0x1B, 0x40, 0x1B, 0x45, 0x01}));
}

TEST_F(InstructionTest, ToStringWithoutDebugModeShowsLabelOnly) {
    Instruction instruction("init", commands);
    EXPECT_EQ(instruction.toString(), "[init]");
}

TEST_F(InstructionTest, ToStringHex) {
    Instruction instruction("init", commands, DebugMode::Hex);
    EXPECT_EQ(instruction.toString(), "[init] 1B 40 1B 45 01");
}

TEST_F(InstructionTest, ToStringDec) {
    Instruction instruction("init", commands, DebugMode::Dec);
    EXPECT_EQ(instruction.toString(), "[init] [27, 64, 27, 69, 1]");
}

TEST_F(InstructionTest, DebugModeDoesNotChangeBytes) {
    Instruction plain("x", commands);
    Instruction hex("x", commands, DebugMode::Hex);
    Instruction dec("x", commands, DebugMode::Dec);
    EXPECT_EQ(plain.flatten(), hex.flatten());
    EXPECT_EQ(plain.flatten(), dec.flatten());
}

TEST_F(InstructionTest, DebugModeNames) {
    EXPECT_EQ(debugModeFromString("hex"), DebugMode::Hex);
    EXPECT_EQ(debugModeFromString("dec"), DebugMode::Dec);
    EXPECT_FALSE(debugModeFromString("binary").has_value());
    EXPECT_EQ(debugModeToString(DebugMode::Hex), "hex");
}
