#include "escpos/command/image/ImageCommands.hpp"
#include "escpos/CommandBuilder.hpp"
#include "escpos/Constants.hpp"

namespace escpos::command::image {

    using namespace escpos::constants;
    using namespace escpos::domain::image;

    ImageCommands::ImageCommands(Protocol *protocol)
            : CommandCategoryInterface(protocol) {}

    Command ImageCommands::bitImage(const BitImage &image) const {
        const auto [xL, xH] = CommandBuilder::parameters2(image.widthBytes());
        const auto [yL, yH] = CommandBuilder::parameters2(image.height());
        const auto data = image.rasterData();

        Command cmd = {GS, 0x76, 0x30, static_cast<uint8_t>(image.size()), xL, xH, yL, yH};
        cmd.insert(cmd.end(), data.begin(), data.end());
        return cmd;
    }

    Command ImageCommands::graphicDensity(GraphicDensity density) const {
        const auto d = static_cast<uint8_t>(density);
        return {GS, 0x28, 0x4C, 0x04, 0x00, 0x30, 0x31, d, d};
    }

    Command ImageCommands::graphicData(const BitImage &image) const {
        const auto data = image.rasterData();
        // 10 byte di intestazione contati nella lunghezza: 30 70 30 bx by c xL xH yL yH
        const auto p = CommandBuilder::parameters4(data.size(), 10);
        const auto [xL, xH] = CommandBuilder::parameters2(image.width());
        const auto [yL, yH] = CommandBuilder::parameters2(image.height());

        Command cmd = {GS, 0x38, 0x4C, p[0], p[1], p[2], p[3],
                       0x30, 0x70, 0x30, 0x01, 0x01, 0x31, xL, xH, yL, yH};
        cmd.insert(cmd.end(), data.begin(), data.end());
        return cmd;
    }

    Command ImageCommands::graphicPrint() const {
        return {GS, 0x28, 0x4C, 0x02, 0x00, 0x30, 0x32};
    }

    std::vector<Command> ImageCommands::graphic(const BitImage &image, GraphicDensity density) const {
        return {
                graphicDensity(density),
                graphicData(image),
                graphicPrint(),
        };
    }

} // namespace escpos::command::image
