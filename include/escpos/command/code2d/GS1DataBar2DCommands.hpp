#pragma once

#include "escpos/command/CommandCategoryInterface.hpp"
#include "escpos/domain/code2d/GS1DataBar2D.hpp"
#include <string>
#include <vector>

namespace escpos::command::code2d {

/**
 * @brief Comandi GS1 DataBar composito 2D (GS ( k, cn = 51).
 */
    class GS1DataBar2DCommands : public CommandCategoryInterface {
    public:
        explicit GS1DataBar2DCommands(Protocol *protocol);

        Command width(domain::code2d::GS1DataBar2DWidth width) const;

        /// Larghezza massima Expanded Stacked; emette sempre la coppia (0, 0).
        Command expandedMaxWidth() const;

        /**
         * @throws types::InputException se il payload non è valido per il tipo.
         */
        Command data(domain::code2d::GS1DataBar2DType type, const std::string &data) const;

        Command print() const;

        /**
         * @brief Sequenza ordinata: width, expanded max width, data, print.
         */
        std::vector<Command> gs1DataBar2D(const domain::code2d::GS1DataBar2D &code) const;
    };

} // namespace escpos::command::code2d
