#include "escpos/domain/image/BitImage.hpp"
#include "escpos/types/Error.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace escpos::domain::image {

    namespace {
        void checkMultipleOf8(const char *field, std::optional<uint32_t> value) {
            if (value && *value % 8 != 0) {
                throw types::InputException(std::string("bit image ") + field + " must be a multiple of 8, got " +
                                            std::to_string(*value));
            }
        }

        // Composite over opaque white.
        uint32_t flatten(uint32_t channel, uint32_t alpha) {
            return (channel * alpha + (255 - alpha) * 255) / 255;
        }

        uint8_t luma(const Rgba &pixel) {
            const uint32_t r = flatten(pixel.r, pixel.a);
            const uint32_t g = flatten(pixel.g, pixel.a);
            const uint32_t b = flatten(pixel.b, pixel.a);
            return static_cast<uint8_t>((2126 * r + 7152 * g + 722 * b) / 10000);
        }
    }

    std::string toString(BitImageSize size) {
        switch (size) {
            case BitImageSize::Normal:
                return "Normal";
            case BitImageSize::DoubleWidth:
                return "Double width";
            case BitImageSize::DoubleHeight:
                return "Double height";
            case BitImageSize::DoubleWidthAndHeight:
                return "Double width and height";
        }
        return "Unknown";
    }

    BitImageOption::BitImageOption()
            : maxWidth_(512), maxHeight_(512), size_(BitImageSize::Normal) {}

    BitImageOption::BitImageOption(std::optional<uint32_t> maxWidth, std::optional<uint32_t> maxHeight,
                                   BitImageSize size)
            : maxWidth_(maxWidth), maxHeight_(maxHeight), size_(size) {
        checkMultipleOf8("max width", maxWidth_);
        checkMultipleOf8("max height", maxHeight_);
    }

    std::optional<uint32_t> BitImageOption::maxWidth() const {
        return maxWidth_;
    }

    std::optional<uint32_t> BitImageOption::maxHeight() const {
        return maxHeight_;
    }

    BitImageSize BitImageOption::size() const {
        return size_;
    }

    BitImage::BitImage(const DecodedImage &source, BitImageOption option)
            : width_(source.width()),
              height_(source.height()),
              size_(option.size()) {
        const uint32_t srcWidth = source.width();
        const uint32_t srcHeight = source.height();

        const bool exceeds = (option.maxWidth() && srcWidth > *option.maxWidth()) ||
                             (option.maxHeight() && srcHeight > *option.maxHeight());

        if (exceeds && srcWidth > 0 && srcHeight > 0) {
            double ratio = std::numeric_limits<double>::infinity();
            if (option.maxWidth()) {
                ratio = std::min(ratio, static_cast<double>(*option.maxWidth()) / srcWidth);
            }
            if (option.maxHeight()) {
                ratio = std::min(ratio, static_cast<double>(*option.maxHeight()) / srcHeight);
            }
            width_ = std::max<uint32_t>(1, static_cast<uint32_t>(std::lround(srcWidth * ratio)));
            height_ = std::max<uint32_t>(1, static_cast<uint32_t>(std::lround(srcHeight * ratio)));
        }

        gray_.resize(static_cast<size_t>(width_) * height_);
        for (uint32_t y = 0; y < height_; ++y) {
            const auto srcY = static_cast<uint32_t>(
                    std::min<uint64_t>(srcHeight - 1, (2ULL * y + 1) * srcHeight / (2ULL * height_)));
            for (uint32_t x = 0; x < width_; ++x) {
                const auto srcX = static_cast<uint32_t>(
                        std::min<uint64_t>(srcWidth - 1, (2ULL * x + 1) * srcWidth / (2ULL * width_)));
                gray_[static_cast<size_t>(y) * width_ + x] = luma(source.pixel(srcX, srcY));
            }
        }
    }

    uint32_t BitImage::width() const {
        return width_;
    }

    uint32_t BitImage::height() const {
        return height_;
    }

    uint32_t BitImage::widthBytes() const {
        return (width_ + 7) / 8;
    }

    BitImageSize BitImage::size() const {
        return size_;
    }

    uint8_t BitImage::gray(uint32_t x, uint32_t y) const {
        return gray_.at(static_cast<size_t>(y) * width_ + x);
    }

    bool BitImage::isInk(uint32_t x, uint32_t y) const {
        return gray(x, y) <= 128;
    }

    std::vector<uint8_t> BitImage::rasterData() const {
        std::vector<uint8_t> data;
        data.reserve(static_cast<size_t>(widthBytes()) * height_);

        for (uint32_t y = 0; y < height_; ++y) {
            for (uint32_t x = 0; x < width_; x += 8) {
                uint8_t byte = 0;
                for (uint32_t bit = 0; bit < 8; ++bit) {
                    const uint32_t px = x + bit;
                    if (px < width_ && isInk(px, y)) {
                        byte |= static_cast<uint8_t>(0x80 >> bit);
                    }
                }
                data.push_back(byte);
            }
        }
        return data;
    }

} // namespace escpos::domain::image
