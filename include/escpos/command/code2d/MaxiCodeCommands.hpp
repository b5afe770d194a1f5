#pragma once

#include "escpos/command/CommandCategoryInterface.hpp"
#include "escpos/domain/code2d/MaxiCode.hpp"
#include <string>
#include <vector>

namespace escpos::command::code2d {

/**
 * @brief Comandi MaxiCode (GS ( k, cn = 50).
 */
    class MaxiCodeCommands : public CommandCategoryInterface {
    public:
        explicit MaxiCodeCommands(Protocol *protocol);

        Command mode(domain::code2d::MaxiCodeMode mode) const;

        /**
         * @brief Modalità numerica 2..6.
         */
        Command mode(uint8_t mode) const;

        Command data(const std::string &data) const;

        Command print() const;

        /**
         * @brief Sequenza ordinata: mode, data, print.
         */
        std::vector<Command> maxiCode(const domain::code2d::MaxiCode &code) const;
    };

} // namespace escpos::command::code2d
