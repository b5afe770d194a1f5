#include "escpos/command/code2d/GS1DataBar2DCommands.hpp"
#include "escpos/CommandBuilder.hpp"
#include "escpos/Constants.hpp"
#include "escpos/types/Error.hpp"

namespace escpos::command::code2d {

    using namespace escpos::constants;
    using namespace escpos::domain::code2d;

    GS1DataBar2DCommands::GS1DataBar2DCommands(Protocol *protocol)
            : CommandCategoryInterface(protocol) {}

    Command GS1DataBar2DCommands::width(GS1DataBar2DWidth width) const {
        return CommandBuilder::frame(CN_GS1_DATABAR, 0x43, {static_cast<uint8_t>(width)});
    }

    Command GS1DataBar2DCommands::expandedMaxWidth() const {
        return CommandBuilder::frame(CN_GS1_DATABAR, 0x47, {0x00, 0x00});
    }

    Command GS1DataBar2DCommands::data(GS1DataBar2DType type, const std::string &data) const {
        if (!GS1DataBar2D::isValid(type, data)) {
            throw types::InputException("invalid " + toString(type) + " data: " + data);
        }
        return CommandBuilder::dataFrame(CN_GS1_DATABAR, {static_cast<uint8_t>(type)}, data);
    }

    Command GS1DataBar2DCommands::print() const {
        return CommandBuilder::frame(CN_GS1_DATABAR, FN_PRINT, {STORE_PRINT_M});
    }

    std::vector<Command> GS1DataBar2DCommands::gs1DataBar2D(const GS1DataBar2D &code) const {
        const auto &option = code.option();
        return {
                width(option.width),
                expandedMaxWidth(),
                data(option.type, code.data()),
                print(),
        };
    }

} // namespace escpos::command::code2d
