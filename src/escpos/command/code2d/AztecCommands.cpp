#include "escpos/command/code2d/AztecCommands.hpp"
#include "escpos/CommandBuilder.hpp"
#include "escpos/Constants.hpp"

namespace escpos::command::code2d {

    using namespace escpos::constants;
    using namespace escpos::domain::code2d;

    AztecCommands::AztecCommands(Protocol *protocol)
            : CommandCategoryInterface(protocol) {}

    Command AztecCommands::mode(const AztecMode &mode) const {
        const auto [n1, n2] = mode.bytes();
        return CommandBuilder::frame(CN_AZTEC, 0x42, {n1, n2});
    }

    Command AztecCommands::size(uint8_t size) const {
        checkRange("Aztec module size", size, 2, 16);
        return CommandBuilder::frame(CN_AZTEC, 0x43, {size});
    }

    Command AztecCommands::correctionLevel(uint8_t level) const {
        checkRange("Aztec correction level", level, 5, 95);
        return CommandBuilder::frame(CN_AZTEC, 0x45, {level});
    }

    Command AztecCommands::data(const std::string &data) const {
        return CommandBuilder::dataFrame(CN_AZTEC, {}, data);
    }

    Command AztecCommands::print() const {
        return CommandBuilder::frame(CN_AZTEC, FN_PRINT, {STORE_PRINT_M});
    }

    std::vector<Command> AztecCommands::aztec(const Aztec &code) const {
        const auto &option = code.option();
        return {
                mode(option.mode()),
                size(option.size()),
                correctionLevel(option.correctionLevel()),
                data(code.data()),
                print(),
        };
    }

} // namespace escpos::command::code2d
