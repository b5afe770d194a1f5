#include "escpos/command/barcode/BarcodeCommands.hpp"
#include "escpos/CommandBuilder.hpp"
#include "escpos/Constants.hpp"
#include "escpos/types/Error.hpp"

#include <algorithm>

namespace escpos::command::barcode {

    using namespace escpos::constants;
    using namespace escpos::domain::barcode;

    BarcodeCommands::BarcodeCommands(Protocol *protocol)
            : CommandCategoryInterface(protocol) {}

    Command BarcodeCommands::width(uint8_t width) const {
        if (width == 0) {
            throw types::InputException("barcode width cannot be equal to 0");
        }
        return CommandBuilder::build({GS, 0x77}, {std::min<uint8_t>(width, 5)});
    }

    Command BarcodeCommands::height(uint8_t height) const {
        if (height == 0) {
            throw types::InputException("barcode height cannot be equal to 0");
        }
        return CommandBuilder::build({GS, 0x68}, {height});
    }

    Command BarcodeCommands::font(BarcodeFont font) const {
        return CommandBuilder::build({GS, 0x66}, {static_cast<uint8_t>(font)});
    }

    Command BarcodeCommands::position(BarcodePosition position) const {
        return CommandBuilder::build({GS, 0x48}, {static_cast<uint8_t>(position)});
    }

    Command BarcodeCommands::print(BarcodeSystem system, const std::string &data) const {
        Barcode::validate(system, data);

        Command cmd = {GS, 0x6B, static_cast<uint8_t>(system)};
        cmd.insert(cmd.end(), data.begin(), data.end());
        cmd.push_back(NUL);
        return cmd;
    }

    std::vector<Command> BarcodeCommands::barcode(const Barcode &barcode) const {
        const auto &option = barcode.option();
        return {
                width(widthValue(option.width)),
                height(heightValue(option.height)),
                font(option.font),
                position(option.position),
                print(barcode.system(), barcode.data()),
        };
    }

} // namespace escpos::command::barcode
