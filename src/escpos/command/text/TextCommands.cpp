#include "escpos/command/text/TextCommands.hpp"
#include "escpos/CommandBuilder.hpp"
#include "escpos/Constants.hpp"
#include "escpos/Protocol.hpp"

namespace escpos::command::text {

    using namespace escpos::constants;

    namespace {
        uint8_t flag(bool enabled) {
            return enabled ? 1 : 0;
        }
    }

    TextCommands::TextCommands(Protocol *protocol)
            : CommandCategoryInterface(protocol) {}

    Command TextCommands::bold(bool enabled) const {
        return CommandBuilder::build({ESC, 0x45}, {flag(enabled)});
    }

    Command TextCommands::underline(domain::UnderlineMode mode) const {
        return CommandBuilder::build({ESC, 0x2D}, {static_cast<uint8_t>(mode)});
    }

    Command TextCommands::doubleStrike(bool enabled) const {
        return CommandBuilder::build({ESC, 0x47}, {flag(enabled)});
    }

    Command TextCommands::font(domain::Font font) const {
        return CommandBuilder::build({ESC, 0x4D}, {static_cast<uint8_t>(font)});
    }

    Command TextCommands::flip(bool enabled) const {
        return CommandBuilder::build({ESC, 0x56}, {flag(enabled)});
    }

    Command TextCommands::justify(domain::JustifyMode mode) const {
        return CommandBuilder::build({ESC, 0x61}, {static_cast<uint8_t>(mode)});
    }

    Command TextCommands::reverseColours(bool enabled) const {
        return CommandBuilder::build({GS, 0x42}, {flag(enabled)});
    }

    Command TextCommands::smoothing(bool enabled) const {
        return CommandBuilder::build({GS, 0x62}, {flag(enabled)});
    }

    Command TextCommands::textSize(uint8_t width, uint8_t height) const {
        checkRange("text size width", width, 1, 8);
        checkRange("text size height", height, 1, 8);

        const auto n = static_cast<uint8_t>(((width - 1) << 4) | (height - 1));
        return CommandBuilder::build({GS, 0x21}, {n});
    }

    Command TextCommands::upsideDown(bool enabled) const {
        return CommandBuilder::build({ESC, 0x7B}, {flag(enabled)});
    }

    Command TextCommands::text(const std::string &value, std::optional<domain::PageCode> pageCode,
                               std::optional<std::size_t> maxLength) const {
        return protocol_->encoder().encode(value, pageCode, maxLength);
    }

} // namespace escpos::command::text
