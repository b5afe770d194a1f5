#include "gtest/gtest.h"
#include "test_utils.h"
#include "escpos/Protocol.hpp"
#include "escpos/types/Error.hpp"

using namespace escpos;
using namespace escpos::domain::code2d;

class MaxiCodeTest : public ::testing::Test {
protected:
    Protocol protocol;
};

TEST_F(MaxiCodeTest, ModeFromEnumAndNumber) {
    EXPECT_EQ(protocol.maxiCode()->mode(MaxiCodeMode::Mode4),
              test::bytes({0x1D, 0x28, 0x6B, 0x03, 0x00, 0x32, 0x41, 0x34}));
    EXPECT_EQ(protocol.maxiCode()->mode(static_cast<uint8_t>(6)),
              test::bytes({0x1D, 0x28, 0x6B, 0x03, 0x00, 0x32, 0x41, 0x36}));
    EXPECT_THROW(protocol.maxiCode()->mode(static_cast<uint8_t>(1)), types::InputException);
    EXPECT_THROW(protocol.maxiCode()->mode(static_cast<uint8_t>(7)), types::InputException);
}

TEST_F(MaxiCodeTest, DefaultSequence) {
    const auto cmds = protocol.maxiCode()->maxiCode(MaxiCode("12"));
    ASSERT_EQ(cmds.size(), 3u);
    EXPECT_EQ(cmds[0][7], 0x32);
    EXPECT_EQ(cmds[1], test::bytes({0x1D, 0x28, 0x6B, 0x05, 0x00, 0x32, 0x50, 0x30, '1', '2'}));
    EXPECT_EQ(cmds[2], test::bytes({0x1D, 0x28, 0x6B, 0x03, 0x00, 0x32, 0x51, 0x30}));
}
