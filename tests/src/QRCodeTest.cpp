#include "gtest/gtest.h"
#include "test_utils.h"
#include "escpos/Protocol.hpp"
#include "escpos/types/Error.hpp"

using namespace escpos;
using namespace escpos::domain::code2d;

class QRCodeTest : public ::testing::Test {
protected:
    Protocol protocol;
};

TEST_F(QRCodeTest, SizeIsClampedTo15) {
    EXPECT_EQ(protocol.qrcode()->size(20), test::bytes({0x1D, 0x28, 0x6B, 0x03, 0x00, 0x31, 0x43, 0x0F}));
    EXPECT_EQ(protocol.qrcode()->size(6), test::bytes({0x1D, 0x28, 0x6B, 0x03, 0x00, 0x31, 0x43, 0x06}));
}

TEST_F(QRCodeTest, ModelAndCorrection) {
    EXPECT_EQ(protocol.qrcode()->model(QRCodeModel::Model2),
              test::bytes({0x1D, 0x28, 0x6B, 0x04, 0x00, 0x31, 0x41, 0x32, 0x00}));
    EXPECT_EQ(protocol.qrcode()->correctionLevel(QRCodeCorrectionLevel::Q),
              test::bytes({0x1D, 0x28, 0x6B, 0x03, 0x00, 0x31, 0x45, 0x32}));
}

TEST_F(QRCodeTest, DataFrameLength) {
    EXPECT_EQ(protocol.qrcode()->data("AB"),
              test::bytes({0x1D, 0x28, 0x6B, 0x05, 0x00, 0x31, 0x50, 0x30, 'A', 'B'}));
}

TEST_F(QRCodeTest, FullSequence) {
    const QRCode code("hello");
    const auto cmds = protocol.qrcode()->qrcode(code);
    ASSERT_EQ(cmds.size(), 5u);
    EXPECT_EQ(cmds[0][7], 0x31);
    EXPECT_EQ(cmds[1][7], 4);
    EXPECT_EQ(cmds[2][7], 0x33);
    EXPECT_EQ(cmds[4], test::bytes({0x1D, 0x28, 0x6B, 0x03, 0x00, 0x31, 0x51, 0x30}));
}

TEST_F(QRCodeTest, OversizedDataThrows) {
    const std::string data(7090, 'x');
    EXPECT_THROW(QRCode{data}, types::InputException);
    EXPECT_THROW(protocol.qrcode()->data(data), types::InputException);
    EXPECT_NO_THROW(QRCode(std::string(7089, 'x')));
}
