#include "gtest/gtest.h"
#include "test_utils.h"
#include "escpos/Protocol.hpp"
#include "escpos/types/Error.hpp"

using namespace escpos;
using namespace escpos::domain::code2d;

class AztecTest : public ::testing::Test {
protected:
    Protocol protocol;
};

TEST_F(AztecTest, LayerRanges) {
    EXPECT_NO_THROW(AztecMode::fullRange(0));
    EXPECT_NO_THROW(AztecMode::fullRange(4));
    EXPECT_NO_THROW(AztecMode::fullRange(32));
    EXPECT_THROW(AztecMode::fullRange(3), types::InputException);
    EXPECT_THROW(AztecMode::fullRange(33), types::InputException);
    EXPECT_NO_THROW(AztecMode::compact(4));
    EXPECT_THROW(AztecMode::compact(5), types::InputException);
}

TEST_F(AztecTest, ModeBytes) {
    EXPECT_EQ(protocol.aztec()->mode(AztecMode::compact(2)),
              test::bytes({0x1D, 0x28, 0x6B, 0x04, 0x00, 0x36, 0x42, 0x01, 0x02}));
    EXPECT_EQ(protocol.aztec()->mode(AztecMode::fullRange(10)),
              test::bytes({0x1D, 0x28, 0x6B, 0x04, 0x00, 0x36, 0x42, 0x00, 0x0A}));
}

TEST_F(AztecTest, OptionRanges) {
    EXPECT_THROW(AztecOption(AztecMode(), 1, 23), types::InputException);
    EXPECT_THROW(AztecOption(AztecMode(), 3, 4), types::InputException);
    EXPECT_THROW(AztecOption(AztecMode(), 3, 96), types::InputException);
    EXPECT_THROW(protocol.aztec()->correctionLevel(100), types::InputException);
}

TEST_F(AztecTest, DefaultSequence) {
    const auto cmds = protocol.aztec()->aztec(Aztec("A"));
    ASSERT_EQ(cmds.size(), 5u);
    EXPECT_EQ(cmds[0], test::bytes({0x1D, 0x28, 0x6B, 0x04, 0x00, 0x36, 0x42, 0x00, 0x00}));
    EXPECT_EQ(cmds[1], test::bytes({0x1D, 0x28, 0x6B, 0x03, 0x00, 0x36, 0x43, 3}));
    EXPECT_EQ(cmds[2], test::bytes({0x1D, 0x28, 0x6B, 0x03, 0x00, 0x36, 0x45, 23}));
    EXPECT_EQ(cmds[3], test::bytes({0x1D, 0x28, 0x6B, 0x04, 0x00, 0x36, 0x50, 0x30, 'A'}));
}
