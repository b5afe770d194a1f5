#pragma once

#include "escpos/command/CommandCategoryInterface.hpp"
#include "escpos/domain/code2d/Pdf417.hpp"
#include <string>
#include <vector>

namespace escpos::command::code2d {

/**
 * @brief Comandi PDF417 (GS ( k, cn = 48).
 */
    class Pdf417Commands : public CommandCategoryInterface {
    public:
        explicit Pdf417Commands(Protocol *protocol);

        /// 0..30, 0 = automatico.
        Command columns(uint8_t columns) const;

        /// 0 oppure 3..90.
        Command rows(uint8_t rows) const;

        /// 2..8
        Command width(uint8_t width) const;

        /// 2..8
        Command rowHeight(uint8_t rowHeight) const;

        Command correctionLevel(const domain::code2d::Pdf417CorrectionLevel &level) const;

        Command type(domain::code2d::Pdf417Type type) const;

        Command data(const std::string &data) const;

        Command print() const;

        /**
         * @brief Sequenza ordinata: columns, rows, width, row height, correction level, type, data, print.
         */
        std::vector<Command> pdf417(const domain::code2d::Pdf417 &code) const;
    };

} // namespace escpos::command::code2d
