#include "escpos/printer/PrinterOptions.hpp"

namespace escpos::printer {

    PrinterOptions::PrinterOptions(std::optional<domain::PageCode> pageCode, std::optional<DebugMode> debugMode,
                                   uint8_t charactersPerLine)
            : pageCode_(pageCode),
              debugMode_(debugMode),
              charactersPerLine_(charactersPerLine) {}

    std::optional<domain::PageCode> PrinterOptions::pageCode() const {
        return pageCode_;
    }

    void PrinterOptions::setPageCode(std::optional<domain::PageCode> pageCode) {
        pageCode_ = pageCode;
    }

    std::optional<DebugMode> PrinterOptions::debugMode() const {
        return debugMode_;
    }

    void PrinterOptions::setDebugMode(std::optional<DebugMode> debugMode) {
        debugMode_ = debugMode;
    }

    uint8_t PrinterOptions::charactersPerLine() const {
        return charactersPerLine_;
    }

    void PrinterOptions::setCharactersPerLine(uint8_t charactersPerLine) {
        charactersPerLine_ = charactersPerLine;
    }

} // namespace escpos::printer
