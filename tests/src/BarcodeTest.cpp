#include "gtest/gtest.h"
#include "test_utils.h"
#include "escpos/Protocol.hpp"
#include "escpos/types/Error.hpp"

using namespace escpos;
using namespace escpos::domain::barcode;

class BarcodeTest : public ::testing::Test {
protected:
    Protocol protocol;
};

TEST_F(BarcodeTest, Ean13PrintCommand) {
    const auto cmd = protocol.barcode()->print(BarcodeSystem::EAN13, "4006381333931");
    Command expected = {0x1D, 0x6B, 0x02};
    for (const char c: std::string("4006381333931")) expected.push_back(static_cast<uint8_t>(c));
    expected.push_back(0x00);
    EXPECT_EQ(cmd, expected);
}

TEST_F(BarcodeTest, DefaultOptionSequence) {
    const Barcode code(BarcodeSystem::EAN8, "1234567");
    const auto cmds = protocol.barcode()->barcode(code);
    ASSERT_EQ(cmds.size(), 5u);
    EXPECT_EQ(cmds[0], test::bytes({0x1D, 0x77, 3}));
    EXPECT_EQ(cmds[1], test::bytes({0x1D, 0x68, 102}));
    EXPECT_EQ(cmds[2], test::bytes({0x1D, 0x66, 0}));
    EXPECT_EQ(cmds[3], test::bytes({0x1D, 0x48, 2}));
    EXPECT_EQ(cmds[4].front(), 0x1D);
    EXPECT_EQ(cmds[4][2], 0x03);
}

TEST_F(BarcodeTest, WidthIsClampedAndZeroRejected) {
    EXPECT_EQ(protocol.barcode()->width(9), test::bytes({0x1D, 0x77, 5}));
    EXPECT_THROW(protocol.barcode()->width(0), types::InputException);
    EXPECT_THROW(protocol.barcode()->height(0), types::InputException);
}

TEST_F(BarcodeTest, PresetValues) {
    EXPECT_EQ(widthValue(BarcodeWidth::XS), 1);
    EXPECT_EQ(widthValue(BarcodeWidth::XL), 5);
    EXPECT_EQ(heightValue(BarcodeHeight::XS), 51);
    EXPECT_EQ(heightValue(BarcodeHeight::XL), 255);
}

TEST_F(BarcodeTest, NumericSymbologies) {
    EXPECT_TRUE(Barcode::isValid(BarcodeSystem::UPCA, "03600029145"));
    EXPECT_TRUE(Barcode::isValid(BarcodeSystem::UPCA, "036000291452"));
    EXPECT_FALSE(Barcode::isValid(BarcodeSystem::UPCA, "0360002914"));
    EXPECT_FALSE(Barcode::isValid(BarcodeSystem::UPCA, "03600029145A"));

    EXPECT_TRUE(Barcode::isValid(BarcodeSystem::EAN13, "400638133393"));
    EXPECT_FALSE(Barcode::isValid(BarcodeSystem::EAN13, "40063813339312"));
    EXPECT_TRUE(Barcode::isValid(BarcodeSystem::EAN8, "96385074"));
    EXPECT_FALSE(Barcode::isValid(BarcodeSystem::EAN8, "963850"));

    EXPECT_TRUE(Barcode::isValid(BarcodeSystem::ITF, "12"));
    EXPECT_FALSE(Barcode::isValid(BarcodeSystem::ITF, "1"));
}

TEST_F(BarcodeTest, UpcENumberSystem) {
    EXPECT_TRUE(Barcode::isValid(BarcodeSystem::UPCE, "02587965874"));
    EXPECT_TRUE(Barcode::isValid(BarcodeSystem::UPCE, "025879658746"));
    EXPECT_TRUE(Barcode::isValid(BarcodeSystem::UPCE, "02980547"));
    EXPECT_TRUE(Barcode::isValid(BarcodeSystem::UPCE, "985487"));
    EXPECT_TRUE(Barcode::isValid(BarcodeSystem::UPCE, "085487"));

    // Con number system 0 la lunghezza e l'alfabeto non vengono controllati
    EXPECT_TRUE(Barcode::isValid(BarcodeSystem::UPCE, "0"));
    EXPECT_TRUE(Barcode::isValid(BarcodeSystem::UPCE, "0ABC"));
    EXPECT_TRUE(Barcode::isValid(BarcodeSystem::UPCE, "0123456789"));

    EXPECT_FALSE(Barcode::isValid(BarcodeSystem::UPCE, ""));
    EXPECT_FALSE(Barcode::isValid(BarcodeSystem::UPCE, "1f2-58"));
    EXPECT_FALSE(Barcode::isValid(BarcodeSystem::UPCE, "9805874"));
    EXPECT_FALSE(Barcode::isValid(BarcodeSystem::UPCE, "92587965874"));
    EXPECT_FALSE(Barcode::isValid(BarcodeSystem::UPCE, "925879658746"));
    EXPECT_FALSE(Barcode::isValid(BarcodeSystem::UPCE, "92980547"));
}

TEST_F(BarcodeTest, AlphabetSymbologies) {
    EXPECT_TRUE(Barcode::isValid(BarcodeSystem::CODE39, "ABC-123 $%"));
    EXPECT_FALSE(Barcode::isValid(BarcodeSystem::CODE39, "abc"));
    EXPECT_FALSE(Barcode::isValid(BarcodeSystem::CODE39, ""));
    EXPECT_TRUE(Barcode::isValid(BarcodeSystem::CODABAR, "A40156B"));
    EXPECT_FALSE(Barcode::isValid(BarcodeSystem::CODABAR, "A"));
    EXPECT_FALSE(Barcode::isValid(BarcodeSystem::CODABAR, "A4E"));
}

TEST_F(BarcodeTest, InvalidDataIsRejectedBeforeEncoding) {
    EXPECT_THROW(Barcode(BarcodeSystem::EAN13, "12345"), types::InputException);
    EXPECT_THROW(protocol.barcode()->print(BarcodeSystem::EAN8, "ABCDEFG"), types::InputException);
}

TEST_F(BarcodeTest, AlphabetIsExhaustive) {
    const std::string code39 = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ $%*+-./";
    const std::string codabar = "0123456789ABCDabcd$+-./:";
    for (int c = 0x20; c < 0x7F; ++c) {
        const std::string one(1, static_cast<char>(c));
        EXPECT_EQ(Barcode::isValid(BarcodeSystem::CODE39, one), code39.find(one) != std::string::npos) << one;
        EXPECT_EQ(Barcode::isValid(BarcodeSystem::CODABAR, one + one), codabar.find(one) != std::string::npos)
                            << one;
        const bool digit = c >= '0' && c <= '9';
        EXPECT_EQ(Barcode::isValid(BarcodeSystem::EAN13, std::string(12, '0') + one), digit) << one;
    }
}

TEST_F(BarcodeTest, NumericLengthsAreExhaustive) {
    for (std::size_t length = 0; length <= 14; ++length) {
        const std::string digits(length, '0');
        EXPECT_EQ(Barcode::isValid(BarcodeSystem::EAN13, digits), length == 12 || length == 13) << length;
        EXPECT_EQ(Barcode::isValid(BarcodeSystem::EAN8, digits), length == 7 || length == 8) << length;
        EXPECT_EQ(Barcode::isValid(BarcodeSystem::UPCA, digits), length == 11 || length == 12) << length;
        EXPECT_EQ(Barcode::isValid(BarcodeSystem::UPCE, digits), length >= 1) << length;
        EXPECT_EQ(Barcode::isValid(BarcodeSystem::UPCE, std::string(length, '5')), length == 6) << length;
        EXPECT_EQ(Barcode::isValid(BarcodeSystem::ITF, digits), length >= 2) << length;
    }
}
