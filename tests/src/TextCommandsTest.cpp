#include "gtest/gtest.h"
#include "test_utils.h"
#include "escpos/Protocol.hpp"
#include "escpos/types/Error.hpp"

using namespace escpos;
using namespace escpos::domain;

class TextCommandsTest : public ::testing::Test {
protected:
    Protocol protocol;
};

TEST_F(TextCommandsTest, Toggles) {
    EXPECT_EQ(protocol.text()->bold(true), test::bytes({0x1B, 0x45, 0x01}));
    EXPECT_EQ(protocol.text()->bold(false), test::bytes({0x1B, 0x45, 0x00}));
    EXPECT_EQ(protocol.text()->doubleStrike(true), test::bytes({0x1B, 0x47, 0x01}));
    EXPECT_EQ(protocol.text()->flip(true), test::bytes({0x1B, 0x56, 0x01}));
    EXPECT_EQ(protocol.text()->reverseColours(true), test::bytes({0x1D, 0x42, 0x01}));
    EXPECT_EQ(protocol.text()->smoothing(false), test::bytes({0x1D, 0x62, 0x00}));
    EXPECT_EQ(protocol.text()->upsideDown(true), test::bytes({0x1B, 0x7B, 0x01}));
}

TEST_F(TextCommandsTest, EnumeratedSettings) {
    EXPECT_EQ(protocol.text()->underline(UnderlineMode::Double), test::bytes({0x1B, 0x2D, 0x02}));
    EXPECT_EQ(protocol.text()->font(Font::B), test::bytes({0x1B, 0x4D, 0x01}));
    EXPECT_EQ(protocol.text()->justify(JustifyMode::Center), test::bytes({0x1B, 0x61, 0x01}));
}

TEST_F(TextCommandsTest, TextSizeEncodesBothNibbles) {
    EXPECT_EQ(protocol.text()->textSize(1, 1), test::bytes({0x1D, 0x21, 0x00}));
    EXPECT_EQ(protocol.text()->textSize(2, 3), test::bytes({0x1D, 0x21, 0x12}));
    EXPECT_EQ(protocol.text()->textSize(8, 8), test::bytes({0x1D, 0x21, 0x77}));
}

TEST_F(TextCommandsTest, TextSizeOutOfRangeThrows) {
    EXPECT_THROW(protocol.text()->textSize(0, 1), types::InputException);
    EXPECT_THROW(protocol.text()->textSize(1, 9), types::InputException);
}

TEST_F(TextCommandsTest, TextUsesProtocolEncoder) {
    EXPECT_EQ(protocol.text()->text("Café", PageCode::PC437), test::bytes({'C', 'a', 'f', 0x82}));
    EXPECT_EQ(protocol.text()->text("abcdef", std::nullopt, 3), test::bytes({'a', 'b', 'c'}));
}
