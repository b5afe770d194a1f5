#pragma once

#include "escpos/domain/Types.hpp"

namespace escpos::printer {

    /**
     * @brief Stile di testo corrente, azzerato a ogni flush.
     */
    struct PrinterStyleState {
        domain::TextSize textSize;
        domain::JustifyMode justify = domain::JustifyMode::Left;
        domain::Font font = domain::Font::A;
        domain::UnderlineMode underline = domain::UnderlineMode::None;
        bool bold = false;
        bool doubleStrike = false;
        bool reverse = false;
        bool flip = false;

        bool operator==(const PrinterStyleState &other) const {
            return textSize == other.textSize && justify == other.justify && font == other.font &&
                   underline == other.underline && bold == other.bold && doubleStrike == other.doubleStrike &&
                   reverse == other.reverse && flip == other.flip;
        }

        bool operator!=(const PrinterStyleState &other) const {
            return !(*this == other);
        }
    };

} // namespace escpos::printer
