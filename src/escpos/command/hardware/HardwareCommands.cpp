#include "escpos/command/hardware/HardwareCommands.hpp"
#include "escpos/CommandBuilder.hpp"
#include "escpos/Constants.hpp"

namespace escpos::command::hardware {

    using namespace escpos::constants;

    HardwareCommands::HardwareCommands(Protocol *protocol)
            : CommandCategoryInterface(protocol) {}

    Command HardwareCommands::init() const {
        return {ESC, 0x40};
    }

    Command HardwareCommands::reset() const {
        return {ESC, 0x3F, LF, NUL};
    }

    Command HardwareCommands::cancel() const {
        return {CAN};
    }

    Command HardwareCommands::cut(bool partial) const {
        return CommandBuilder::build({GS, 0x56, 0x41}, {static_cast<uint8_t>(partial ? 1 : 0)});
    }

    Command HardwareCommands::pageCode(domain::PageCode code) const {
        return CommandBuilder::build({ESC, 0x74}, {static_cast<uint8_t>(code)});
    }

    Command HardwareCommands::characterSet(domain::CharacterSet set) const {
        return CommandBuilder::build({ESC, 0x52}, {static_cast<uint8_t>(set)});
    }

    Command HardwareCommands::cashDrawer(domain::CashDrawer pin) const {
        return CommandBuilder::build({ESC, 0x70}, {static_cast<uint8_t>(pin)});
    }

    Command HardwareCommands::feed(uint8_t lines) const {
        return CommandBuilder::build({ESC, 0x64}, {lines});
    }

    Command HardwareCommands::lineSpacing(uint8_t value) const {
        return CommandBuilder::build({ESC, 0x33}, {value});
    }

    Command HardwareCommands::resetLineSpacing() const {
        return {ESC, 0x32};
    }

    Command HardwareCommands::motionUnits(uint8_t x, uint8_t y) const {
        return CommandBuilder::build({GS, 0x50}, {x, y});
    }

} // namespace escpos::command::hardware
