#pragma once

#include "escpos/command/CommandCategoryInterface.hpp"
#include "escpos/domain/code2d/QRCode.hpp"
#include <string>
#include <vector>

namespace escpos::command::code2d {

/**
 * @brief Comandi QR code (GS ( k, cn = 49).
 */
    class QRCodeCommands : public CommandCategoryInterface {
    public:
        explicit QRCodeCommands(Protocol *protocol);

        Command model(domain::code2d::QRCodeModel model) const;

        /// Dimensione del modulo, ridotta a 15 se maggiore.
        Command size(uint8_t size) const;

        Command correctionLevel(domain::code2d::QRCodeCorrectionLevel level) const;

        /**
         * @throws types::InputException se il payload supera 7089 byte.
         */
        Command data(const std::string &data) const;

        Command print() const;

        /**
         * @brief Sequenza ordinata: model, size, correction level, data, print.
         */
        std::vector<Command> qrcode(const domain::code2d::QRCode &code) const;
    };

} // namespace escpos::command::code2d
