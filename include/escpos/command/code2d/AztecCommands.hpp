#pragma once

#include "escpos/command/CommandCategoryInterface.hpp"
#include "escpos/domain/code2d/Aztec.hpp"
#include <string>
#include <vector>

namespace escpos::command::code2d {

/**
 * @brief Comandi Aztec (GS ( k, cn = 54).
 */
    class AztecCommands : public CommandCategoryInterface {
    public:
        explicit AztecCommands(Protocol *protocol);

        Command mode(const domain::code2d::AztecMode &mode) const;

        /// 2..16
        Command size(uint8_t size) const;

        /// 5..95
        Command correctionLevel(uint8_t level) const;

        Command data(const std::string &data) const;

        Command print() const;

        /**
         * @brief Sequenza ordinata: mode, size, correction level, data, print.
         */
        std::vector<Command> aztec(const domain::code2d::Aztec &code) const;
    };

} // namespace escpos::command::code2d
