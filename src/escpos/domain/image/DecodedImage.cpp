#include "escpos/domain/image/DecodedImage.hpp"
#include "escpos/types/Error.hpp"

#include <string>

namespace escpos::domain::image {

    RgbaImage::RgbaImage(uint32_t width, uint32_t height, Rgba fill)
            : width_(width),
              height_(height),
              pixels_(static_cast<size_t>(width) * height, fill) {}

    uint32_t RgbaImage::width() const {
        return width_;
    }

    uint32_t RgbaImage::height() const {
        return height_;
    }

    Rgba RgbaImage::pixel(uint32_t x, uint32_t y) const {
        if (x >= width_ || y >= height_) {
            throw types::InputException("pixel (" + std::to_string(x) + "," + std::to_string(y) +
                                        ") outside a " + std::to_string(width_) + "x" +
                                        std::to_string(height_) + " image");
        }
        return pixels_[static_cast<size_t>(y) * width_ + x];
    }

    void RgbaImage::setPixel(uint32_t x, uint32_t y, Rgba value) {
        if (x >= width_ || y >= height_) {
            throw types::InputException("pixel (" + std::to_string(x) + "," + std::to_string(y) +
                                        ") outside a " + std::to_string(width_) + "x" +
                                        std::to_string(height_) + " image");
        }
        pixels_[static_cast<size_t>(y) * width_ + x] = value;
    }

} // namespace escpos::domain::image
