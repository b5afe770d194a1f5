#pragma once

#include "escpos/command/CommandCategoryInterface.hpp"
#include "escpos/domain/Types.hpp"

namespace escpos::command::hardware {

/**
 * @brief Comandi di controllo della stampante: init, taglio, avanzamento, cassetto.
 */
    class HardwareCommands : public CommandCategoryInterface {
    public:
        explicit HardwareCommands(Protocol *protocol);

        /// ESC @
        Command init() const;

        /// ESC ? LF NUL
        Command reset() const;

        /// CAN
        Command cancel() const;

        /// GS V A n, n = 1 per il taglio parziale.
        Command cut(bool partial) const;

        /// ESC t n
        Command pageCode(domain::PageCode code) const;

        /// ESC R n
        Command characterSet(domain::CharacterSet set) const;

        /// ESC p m
        Command cashDrawer(domain::CashDrawer pin) const;

        /// ESC d n
        Command feed(uint8_t lines) const;

        /// ESC 3 n
        Command lineSpacing(uint8_t value) const;

        /// ESC 2
        Command resetLineSpacing() const;

        /// GS P x y
        Command motionUnits(uint8_t x, uint8_t y) const;
    };

} // namespace escpos::command::hardware
