#pragma once

#include "escpos/command/CommandCategoryInterface.hpp"
#include "escpos/domain/barcode/Barcode.hpp"
#include <string>
#include <vector>

namespace escpos::command::barcode {

/**
 * @brief Comandi per i codici a barre 1D (GS w, GS h, GS f, GS H, GS k).
 */
    class BarcodeCommands : public CommandCategoryInterface {
    public:
        explicit BarcodeCommands(Protocol *protocol);

        /**
         * @brief GS w n. Valori sopra 5 vengono ridotti a 5.
         * @throws types::InputException se width è 0.
         */
        Command width(uint8_t width) const;

        /**
         * @throws types::InputException se height è 0.
         */
        Command height(uint8_t height) const;

        Command font(domain::barcode::BarcodeFont font) const;

        Command position(domain::barcode::BarcodePosition position) const;

        /**
         * @brief GS k m data NUL. Il payload viene validato prima di produrre byte.
         */
        Command print(domain::barcode::BarcodeSystem system, const std::string &data) const;

        /**
         * @brief Sequenza ordinata: width, height, font, position, print.
         */
        std::vector<Command> barcode(const domain::barcode::Barcode &barcode) const;
    };

} // namespace escpos::command::barcode
