#pragma once

#include "escpos/Command.hpp"
#include "escpos/Constants.hpp"
#include "escpos/domain/Types.hpp"
#include <cstdint>
#include <optional>

namespace escpos::printer {

    class PrinterOptions {
    public:
        PrinterOptions() = default;

        PrinterOptions(std::optional<domain::PageCode> pageCode, std::optional<DebugMode> debugMode,
                       uint8_t charactersPerLine = constants::DEFAULT_CHARACTERS_PER_LINE);

        std::optional<domain::PageCode> pageCode() const;

        void setPageCode(std::optional<domain::PageCode> pageCode);

        std::optional<DebugMode> debugMode() const;

        void setDebugMode(std::optional<DebugMode> debugMode);

        uint8_t charactersPerLine() const;

        void setCharactersPerLine(uint8_t charactersPerLine);

    private:
        std::optional<domain::PageCode> pageCode_;
        std::optional<DebugMode> debugMode_;
        uint8_t charactersPerLine_ = constants::DEFAULT_CHARACTERS_PER_LINE;
    };

} // namespace escpos::printer
