#include "gtest/gtest.h"
#include "test_utils.h"
#include "escpos/Protocol.hpp"
#include "escpos/types/Error.hpp"

using namespace escpos;
using namespace escpos::domain::code2d;

class GS1DataBar2DTest : public ::testing::Test {
protected:
    Protocol protocol;
};

TEST_F(GS1DataBar2DTest, StackedRequires13Digits) {
    EXPECT_TRUE(GS1DataBar2D::isValid(GS1DataBar2DType::Stacked, "0123456789012"));
    EXPECT_TRUE(GS1DataBar2D::isValid(GS1DataBar2DType::StackedOmnidirectional, "0123456789012"));
    EXPECT_FALSE(GS1DataBar2D::isValid(GS1DataBar2DType::Stacked, "012345678901"));
    EXPECT_FALSE(GS1DataBar2D::isValid(GS1DataBar2DType::Stacked, "012345678901A"));
}

TEST_F(GS1DataBar2DTest, ExpandedStackedAlphabet) {
    EXPECT_TRUE(GS1DataBar2D::isValid(GS1DataBar2DType::ExpandedStacked, ""));
    EXPECT_TRUE(GS1DataBar2D::isValid(GS1DataBar2DType::ExpandedStacked, "{01}98898765432106"));
    EXPECT_FALSE(GS1DataBar2D::isValid(GS1DataBar2DType::ExpandedStacked, "lowercase"));
    EXPECT_FALSE(GS1DataBar2D::isValid(GS1DataBar2DType::ExpandedStacked, std::string(256, '1')));
}

TEST_F(GS1DataBar2DTest, WidthWireValues) {
    EXPECT_EQ(protocol.gs1DataBar2D()->width(GS1DataBar2DWidth::S),
              test::bytes({0x1D, 0x28, 0x6B, 0x03, 0x00, 0x33, 0x43, 0x02}));
    EXPECT_EQ(protocol.gs1DataBar2D()->width(GS1DataBar2DWidth::M),
              test::bytes({0x1D, 0x28, 0x6B, 0x03, 0x00, 0x33, 0x43, 0x01}));
    EXPECT_EQ(protocol.gs1DataBar2D()->width(GS1DataBar2DWidth::L),
              test::bytes({0x1D, 0x28, 0x6B, 0x03, 0x00, 0x33, 0x43, 0x04}));
}

TEST_F(GS1DataBar2DTest, FullSequence) {
    const GS1DataBar2D code("0123456789012", {GS1DataBar2DWidth::L, GS1DataBar2DType::StackedOmnidirectional});
    const auto cmds = protocol.gs1DataBar2D()->gs1DataBar2D(code);
    ASSERT_EQ(cmds.size(), 4u);
    EXPECT_EQ(cmds[1], test::bytes({0x1D, 0x28, 0x6B, 0x04, 0x00, 0x33, 0x47, 0x00, 0x00}));
    // 13 cifre + m + tipo + cn + fn
    EXPECT_EQ(cmds[2][3], 17);
    EXPECT_EQ(cmds[2][7], 0x30);
    EXPECT_EQ(cmds[2][8], 0x49);
    EXPECT_EQ(cmds[3], test::bytes({0x1D, 0x28, 0x6B, 0x03, 0x00, 0x33, 0x51, 0x30}));
}

TEST_F(GS1DataBar2DTest, InvalidDataThrows) {
    EXPECT_THROW(GS1DataBar2D("123"), types::InputException);
    EXPECT_THROW(protocol.gs1DataBar2D()->data(GS1DataBar2DType::Stacked, "abc"), types::InputException);
}
