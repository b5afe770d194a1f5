#pragma once

#include "escpos/domain/Types.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace escpos::domain::ui {

    class LineStyle {
    public:
        enum class Kind {
            Simple,
            Double,
            Dotted,
            Dashed,
            Custom
        };

        LineStyle(Kind kind = Kind::Simple);

        static LineStyle custom(std::string pattern);

        Kind kind() const;

        /// Motivo ripetuto: "-", "=", ".", "- " oppure quello personalizzato.
        std::string pattern() const;

    private:
        Kind kind_;
        std::string custom_;
    };

    /**
     * @brief Linea decorativa larga quanto la riga di stampa, con stile temporaneo opzionale.
     */
    struct Line {
        std::optional<Font> font;
        std::optional<TextSize> size;
        std::optional<JustifyMode> justify;
        LineStyle style;
        std::optional<uint8_t> width;
        uint8_t offset = 0;
    };

    class LineBuilder {
    public:
        LineBuilder &font(Font font);

        LineBuilder &size(TextSize size);

        LineBuilder &justify(JustifyMode justify);

        LineBuilder &style(LineStyle style);

        LineBuilder &width(uint8_t width);

        LineBuilder &offset(uint8_t offset);

        Line build() const;

    private:
        Line line_;
    };

} // namespace escpos::domain::ui
