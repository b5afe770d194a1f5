#pragma once

#include "escpos/command/CommandCategoryInterface.hpp"
#include "escpos/domain/Types.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace escpos::command::text {

/**
 * @brief Comandi di stile del testo e codifica del testo stesso.
 */
    class TextCommands : public CommandCategoryInterface {
    public:
        explicit TextCommands(Protocol *protocol);

        Command bold(bool enabled) const;

        Command underline(domain::UnderlineMode mode) const;

        Command doubleStrike(bool enabled) const;

        Command font(domain::Font font) const;

        Command flip(bool enabled) const;

        Command justify(domain::JustifyMode mode) const;

        Command reverseColours(bool enabled) const;

        Command smoothing(bool enabled) const;

        /**
         * @brief GS ! n con n = ((width - 1) << 4) | (height - 1).
         * @throws types::InputException se width o height non sono in 1..8.
         */
        Command textSize(uint8_t width, uint8_t height) const;

        Command upsideDown(bool enabled) const;

        /**
         * @brief Codifica il testo con l'encoder del protocollo.
         */
        Command text(const std::string &value, std::optional<domain::PageCode> pageCode = std::nullopt,
                     std::optional<std::size_t> maxLength = std::nullopt) const;
    };

} // namespace escpos::command::text
