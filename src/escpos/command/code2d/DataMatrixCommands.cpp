#include "escpos/command/code2d/DataMatrixCommands.hpp"
#include "escpos/CommandBuilder.hpp"
#include "escpos/Constants.hpp"

namespace escpos::command::code2d {

    using namespace escpos::constants;
    using namespace escpos::domain::code2d;

    DataMatrixCommands::DataMatrixCommands(Protocol *protocol)
            : CommandCategoryInterface(protocol) {}

    Command DataMatrixCommands::type(const DataMatrixType &type) const {
        const auto [m, d1, d2] = type.bytes();
        return CommandBuilder::frame(CN_DATAMATRIX, 0x42, {m, d1, d2});
    }

    Command DataMatrixCommands::size(uint8_t size) const {
        checkRange("DataMatrix module size", size, 2, 16);
        return CommandBuilder::frame(CN_DATAMATRIX, 0x43, {size});
    }

    Command DataMatrixCommands::data(const std::string &data) const {
        return CommandBuilder::dataFrame(CN_DATAMATRIX, {}, data);
    }

    Command DataMatrixCommands::print() const {
        return CommandBuilder::frame(CN_DATAMATRIX, FN_PRINT, {STORE_PRINT_M});
    }

    std::vector<Command> DataMatrixCommands::dataMatrix(const DataMatrix &code) const {
        const auto &option = code.option();
        return {
                type(option.type()),
                size(option.size()),
                data(code.data()),
                print(),
        };
    }

} // namespace escpos::command::code2d
