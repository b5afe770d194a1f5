#include "escpos/command/code2d/QRCodeCommands.hpp"
#include "escpos/CommandBuilder.hpp"
#include "escpos/Constants.hpp"
#include "escpos/types/Error.hpp"

#include <algorithm>

namespace escpos::command::code2d {

    using namespace escpos::constants;
    using namespace escpos::domain::code2d;

    QRCodeCommands::QRCodeCommands(Protocol *protocol)
            : CommandCategoryInterface(protocol) {}

    Command QRCodeCommands::model(QRCodeModel model) const {
        return CommandBuilder::frame(CN_QRCODE, 0x41, {static_cast<uint8_t>(model), 0x00});
    }

    Command QRCodeCommands::size(uint8_t size) const {
        return CommandBuilder::frame(CN_QRCODE, 0x43, {std::min<uint8_t>(size, 15)});
    }

    Command QRCodeCommands::correctionLevel(QRCodeCorrectionLevel level) const {
        return CommandBuilder::frame(CN_QRCODE, 0x45, {static_cast<uint8_t>(level)});
    }

    Command QRCodeCommands::data(const std::string &data) const {
        if (data.size() > QRCODE_MAX_DATA_LENGTH) {
            throw types::InputException("QR code data length must be at most " +
                                        std::to_string(QRCODE_MAX_DATA_LENGTH) + " bytes, got " +
                                        std::to_string(data.size()));
        }
        return CommandBuilder::dataFrame(CN_QRCODE, {}, data);
    }

    Command QRCodeCommands::print() const {
        return CommandBuilder::frame(CN_QRCODE, FN_PRINT, {STORE_PRINT_M});
    }

    std::vector<Command> QRCodeCommands::qrcode(const QRCode &code) const {
        const auto &option = code.option();
        return {
                model(option.model),
                size(option.size),
                correctionLevel(option.correctionLevel),
                data(code.data()),
                print(),
        };
    }

} // namespace escpos::command::code2d
