#include "escpos/domain/ui/Line.hpp"

namespace escpos::domain::ui {

    LineStyle::LineStyle(Kind kind)
            : kind_(kind) {}

    LineStyle LineStyle::custom(std::string pattern) {
        LineStyle style(Kind::Custom);
        style.custom_ = std::move(pattern);
        return style;
    }

    LineStyle::Kind LineStyle::kind() const {
        return kind_;
    }

    std::string LineStyle::pattern() const {
        switch (kind_) {
            case Kind::Simple:
                return "-";
            case Kind::Double:
                return "=";
            case Kind::Dotted:
                return ".";
            case Kind::Dashed:
                return "- ";
            case Kind::Custom:
                return custom_;
        }
        return "-";
    }

    LineBuilder &LineBuilder::font(Font font) {
        line_.font = font;
        return *this;
    }

    LineBuilder &LineBuilder::size(TextSize size) {
        line_.size = size;
        return *this;
    }

    LineBuilder &LineBuilder::justify(JustifyMode justify) {
        line_.justify = justify;
        return *this;
    }

    LineBuilder &LineBuilder::style(LineStyle style) {
        line_.style = std::move(style);
        return *this;
    }

    LineBuilder &LineBuilder::width(uint8_t width) {
        line_.width = width;
        return *this;
    }

    LineBuilder &LineBuilder::offset(uint8_t offset) {
        line_.offset = offset;
        return *this;
    }

    Line LineBuilder::build() const {
        return line_;
    }

} // namespace escpos::domain::ui
