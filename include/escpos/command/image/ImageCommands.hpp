#pragma once

#include "escpos/command/CommandCategoryInterface.hpp"
#include "escpos/domain/image/BitImage.hpp"
#include "escpos/domain/image/Graphic.hpp"
#include <vector>

namespace escpos::command::image {

/**
 * @brief Comandi immagine: raster GS v 0 e grafica GS ( L / GS 8 L.
 */
    class ImageCommands : public CommandCategoryInterface {
    public:
        explicit ImageCommands(Protocol *protocol);

        /**
         * @brief 1D 76 30 m xL xH yL yH data, larghezza in byte e altezza in punti.
         * @throws types::InputException se le dimensioni non stanno in 2 byte.
         */
        Command bitImage(const domain::image::BitImage &image) const;

        Command graphicDensity(domain::image::GraphicDensity density) const;

        /**
         * @brief Memorizza l'immagine nel buffer grafico (GS 8 L, lunghezza su 4 byte).
         */
        Command graphicData(const domain::image::BitImage &image) const;

        Command graphicPrint() const;

        /**
         * @brief Sequenza ordinata: density, data, print.
         */
        std::vector<Command> graphic(const domain::image::BitImage &image,
                                     domain::image::GraphicDensity density) const;
    };

} // namespace escpos::command::image
