#include "gtest/gtest.h"
#include "test_utils.h"
#include "escpos/Protocol.hpp"
#include "escpos/types/Error.hpp"

using namespace escpos;
using namespace escpos::domain::image;

class BitImageTest : public ::testing::Test {
protected:
    Protocol protocol;

    static RgbaImage blackColumns(uint32_t width, uint32_t height, uint32_t every) {
        RgbaImage image(width, height);
        for (uint32_t y = 0; y < height; ++y) {
            for (uint32_t x = 0; x < width; x += every) {
                image.setPixel(x, y, {0, 0, 0, 255});
            }
        }
        return image;
    }
};

TEST_F(BitImageTest, BlankImageHasNoInk) {
    const BitImage bits(RgbaImage(16, 4));
    const auto data = bits.rasterData();
    EXPECT_EQ(data.size(), 8u);
    for (const auto byte: data) EXPECT_EQ(byte, 0);
}

TEST_F(BitImageTest, TransparentPixelsAreWhite) {
    const BitImage bits(RgbaImage(8, 2, {0, 0, 0, 0}));
    EXPECT_EQ(bits.gray(0, 0), 255);
    EXPECT_EQ(bits.rasterData(), test::bytes({0x00, 0x00}));
}

TEST_F(BitImageTest, InkThreshold) {
    RgbaImage image(3, 1);
    image.setPixel(0, 0, {128, 128, 128, 255});
    image.setPixel(1, 0, {129, 129, 129, 255});
    image.setPixel(2, 0, {255, 0, 0, 255});
    const BitImage bits(image);
    EXPECT_TRUE(bits.isInk(0, 0));
    EXPECT_FALSE(bits.isInk(1, 0));
    EXPECT_TRUE(bits.isInk(2, 0));
}

TEST_F(BitImageTest, RowsArePaddedWithZeroBits) {
    // 10 px di larghezza: secondo byte con solo i due bit alti usabili
    const BitImage bits(blackColumns(10, 1, 1));
    EXPECT_EQ(bits.widthBytes(), 2u);
    EXPECT_EQ(bits.rasterData(), test::bytes({0xFF, 0xC0}));
}

TEST_F(BitImageTest, MostSignificantBitIsLeftmost) {
    const BitImage bits(blackColumns(8, 1, 8));
    EXPECT_EQ(bits.rasterData(), test::bytes({0x80}));
}

TEST_F(BitImageTest, ResizeOnlyWhenBoundExceeded) {
    const BitImage small(RgbaImage(100, 50));
    EXPECT_EQ(small.width(), 100u);
    EXPECT_EQ(small.height(), 50u);

    const BitImage wide(RgbaImage(1024, 256));
    EXPECT_EQ(wide.width(), 512u);
    EXPECT_EQ(wide.height(), 128u);

    const BitImage unbounded(RgbaImage(1024, 8), BitImageOption(std::nullopt, std::nullopt));
    EXPECT_EQ(unbounded.width(), 1024u);
}

TEST_F(BitImageTest, OptionBoundsMustBeMultipleOf8) {
    EXPECT_THROW(BitImageOption(100, 512), types::InputException);
    EXPECT_THROW(BitImageOption(512, 7), types::InputException);
    EXPECT_NO_THROW(BitImageOption(256, std::nullopt));
}

TEST_F(BitImageTest, RasterCommandHeader) {
    const BitImage bits(RgbaImage(20, 3), BitImageOption(512, 512, BitImageSize::DoubleHeight));
    const auto cmd = protocol.image()->bitImage(bits);
    ASSERT_EQ(cmd.size(), 8u + 3u * 3u);
    EXPECT_EQ(Command(cmd.begin(), cmd.begin() + 8), test::bytes({0x1D, 0x76, 0x30, 0x02, 0x03, 0x00, 0x03, 0x00}));
}

TEST_F(BitImageTest, GraphicSequence) {
    const BitImage bits(blackColumns(16, 2, 1));
    const auto cmds = protocol.image()->graphic(bits, GraphicDensity::High);
    ASSERT_EQ(cmds.size(), 3u);
    EXPECT_EQ(cmds[0], test::bytes({0x1D, 0x28, 0x4C, 0x04, 0x00, 0x30, 0x31, 0x33, 0x33}));
    EXPECT_EQ(cmds[1], test::bytes({0x1D, 0x38, 0x4C, 14, 0, 0, 0, 0x30, 0x70, 0x30, 0x01, 0x01, 0x31,
                                    16, 0, 2, 0, 0xFF, 0xFF, 0xFF, 0xFF}));
    EXPECT_EQ(cmds[2], test::bytes({0x1D, 0x28, 0x4C, 0x02, 0x00, 0x30, 0x32}));
}
