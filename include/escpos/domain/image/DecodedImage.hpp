#pragma once

#include <cstdint>
#include <vector>

namespace escpos::domain::image {

    struct Rgba {
        uint8_t r = 0;
        uint8_t g = 0;
        uint8_t b = 0;
        uint8_t a = 255;
    };

    /**
     * @brief Sorgente di pixel in sola lettura. La decodifica dei file immagine avviene fuori da questa libreria.
     */
    class DecodedImage {
    public:
        virtual ~DecodedImage() = default;

        virtual uint32_t width() const = 0;

        virtual uint32_t height() const = 0;

        virtual Rgba pixel(uint32_t x, uint32_t y) const = 0;
    };

    /**
     * @brief Buffer RGBA in memoria, per righe.
     */
    class RgbaImage : public DecodedImage {
    public:
        RgbaImage(uint32_t width, uint32_t height, Rgba fill = {255, 255, 255, 255});

        uint32_t width() const override;

        uint32_t height() const override;

        Rgba pixel(uint32_t x, uint32_t y) const override;

        void setPixel(uint32_t x, uint32_t y, Rgba value);

    private:
        uint32_t width_;
        uint32_t height_;
        std::vector<Rgba> pixels_;
    };

} // namespace escpos::domain::image
