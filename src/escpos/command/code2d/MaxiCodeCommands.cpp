#include "escpos/command/code2d/MaxiCodeCommands.hpp"
#include "escpos/CommandBuilder.hpp"
#include "escpos/Constants.hpp"

namespace escpos::command::code2d {

    using namespace escpos::constants;
    using namespace escpos::domain::code2d;

    MaxiCodeCommands::MaxiCodeCommands(Protocol *protocol)
            : CommandCategoryInterface(protocol) {}

    Command MaxiCodeCommands::mode(MaxiCodeMode mode) const {
        return CommandBuilder::frame(CN_MAXICODE, 0x41, {static_cast<uint8_t>(mode)});
    }

    Command MaxiCodeCommands::mode(uint8_t mode) const {
        checkRange("MaxiCode mode", mode, 2, 6);
        return CommandBuilder::frame(CN_MAXICODE, 0x41, {static_cast<uint8_t>(0x30 + mode)});
    }

    Command MaxiCodeCommands::data(const std::string &data) const {
        return CommandBuilder::dataFrame(CN_MAXICODE, {}, data);
    }

    Command MaxiCodeCommands::print() const {
        return CommandBuilder::frame(CN_MAXICODE, FN_PRINT, {STORE_PRINT_M});
    }

    std::vector<Command> MaxiCodeCommands::maxiCode(const MaxiCode &code) const {
        return {
                mode(code.mode()),
                data(code.data()),
                print(),
        };
    }

} // namespace escpos::command::code2d
