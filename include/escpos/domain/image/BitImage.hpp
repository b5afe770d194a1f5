#pragma once

#include "escpos/domain/image/DecodedImage.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace escpos::domain::image {

    enum class BitImageSize : uint8_t {
        Normal = 0,
        DoubleWidth = 1,
        DoubleHeight = 2,
        DoubleWidthAndHeight = 3
    };

    std::string toString(BitImageSize size);

    class BitImageOption {
    public:
        /// Default: 512 x 512, Normal.
        BitImageOption();

        /**
         * @throws types::InputException se un limite presente non è multiplo di 8.
         */
        BitImageOption(std::optional<uint32_t> maxWidth, std::optional<uint32_t> maxHeight,
                       BitImageSize size = BitImageSize::Normal);

        std::optional<uint32_t> maxWidth() const;

        std::optional<uint32_t> maxHeight() const;

        BitImageSize size() const;

    private:
        std::optional<uint32_t> maxWidth_;
        std::optional<uint32_t> maxHeight_;
        BitImageSize size_;
    };

    /**
     * @brief Immagine ridimensionata, appiattita su bianco e convertita in scala di grigi.
     *
     * Il ridimensionamento (nearest neighbour) avviene solo se l'immagine supera i limiti
     * e conserva le proporzioni.
     */
    class BitImage {
    public:
        BitImage(const DecodedImage &source, BitImageOption option = BitImageOption());

        uint32_t width() const;

        uint32_t height() const;

        /// Larghezza di una riga impacchettata, in byte.
        uint32_t widthBytes() const;

        BitImageSize size() const;

        uint8_t gray(uint32_t x, uint32_t y) const;

        bool isInk(uint32_t x, uint32_t y) const;

        /**
         * @brief 8 pixel per byte, MSB a sinistra; l'ultimo byte di riga è riempito a destra con zeri.
         */
        std::vector<uint8_t> rasterData() const;

    private:
        uint32_t width_;
        uint32_t height_;
        BitImageSize size_;
        std::vector<uint8_t> gray_;
    };

} // namespace escpos::domain::image
