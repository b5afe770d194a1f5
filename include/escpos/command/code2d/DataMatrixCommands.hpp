#pragma once

#include "escpos/command/CommandCategoryInterface.hpp"
#include "escpos/domain/code2d/DataMatrix.hpp"
#include <string>
#include <vector>

namespace escpos::command::code2d {

/**
 * @brief Comandi DataMatrix (GS ( k, cn = 53).
 */
    class DataMatrixCommands : public CommandCategoryInterface {
    public:
        explicit DataMatrixCommands(Protocol *protocol);

        Command type(const domain::code2d::DataMatrixType &type) const;

        /// 2..16
        Command size(uint8_t size) const;

        Command data(const std::string &data) const;

        Command print() const;

        /**
         * @brief Sequenza ordinata: type, size, data, print.
         */
        std::vector<Command> dataMatrix(const domain::code2d::DataMatrix &code) const;
    };

} // namespace escpos::command::code2d
