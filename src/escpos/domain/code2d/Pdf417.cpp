#include "escpos/domain/code2d/Pdf417.hpp"
#include "escpos/types/Error.hpp"

namespace escpos::domain::code2d {

    Pdf417CorrectionLevel::Pdf417CorrectionLevel()
            : ratio_(true), value_(1) {}

    Pdf417CorrectionLevel::Pdf417CorrectionLevel(bool ratio, uint8_t value)
            : ratio_(ratio), value_(value) {}

    Pdf417CorrectionLevel Pdf417CorrectionLevel::level(uint8_t level) {
        if (level > 8) {
            throw types::InputException("PDF417 correction level must be in 0..8, got " + std::to_string(level));
        }
        return {false, level};
    }

    Pdf417CorrectionLevel Pdf417CorrectionLevel::ratio(uint8_t ratio) {
        if (ratio < 1 || ratio > 40) {
            throw types::InputException("PDF417 correction ratio must be in 1..40, got " + std::to_string(ratio));
        }
        return {true, ratio};
    }

    bool Pdf417CorrectionLevel::isRatio() const {
        return ratio_;
    }

    uint8_t Pdf417CorrectionLevel::value() const {
        return value_;
    }

    std::pair<uint8_t, uint8_t> Pdf417CorrectionLevel::bytes() const {
        if (ratio_) {
            return {0x31, value_};
        }
        return {0x30, static_cast<uint8_t>(0x30 + value_)};
    }

    Pdf417Option::Pdf417Option()
            : columns_(0),
              rows_(0),
              width_(3),
              rowHeight_(3),
              type_(Pdf417Type::Standard),
              correctionLevel_() {}

    Pdf417Option::Pdf417Option(uint8_t columns, uint8_t rows, uint8_t width, uint8_t rowHeight,
                               Pdf417Type type, Pdf417CorrectionLevel correctionLevel)
            : columns_(columns),
              rows_(rows),
              width_(width),
              rowHeight_(rowHeight),
              type_(type),
              correctionLevel_(correctionLevel) {
        validateColumns(columns_);
        validateRows(rows_);
        validateWidth(width_);
        validateRowHeight(rowHeight_);
    }

    uint8_t Pdf417Option::columns() const {
        return columns_;
    }

    uint8_t Pdf417Option::rows() const {
        return rows_;
    }

    uint8_t Pdf417Option::width() const {
        return width_;
    }

    uint8_t Pdf417Option::rowHeight() const {
        return rowHeight_;
    }

    Pdf417Type Pdf417Option::type() const {
        return type_;
    }

    const Pdf417CorrectionLevel &Pdf417Option::correctionLevel() const {
        return correctionLevel_;
    }

    void Pdf417Option::validateColumns(uint8_t columns) {
        if (columns > 30) {
            throw types::InputException("PDF417 columns must be in 0..30, got " + std::to_string(columns));
        }
    }

    void Pdf417Option::validateRows(uint8_t rows) {
        if (rows != 0 && (rows < 3 || rows > 90)) {
            throw types::InputException("PDF417 rows must be 0 or in 3..90, got " + std::to_string(rows));
        }
    }

    void Pdf417Option::validateWidth(uint8_t width) {
        if (width < 2 || width > 8) {
            throw types::InputException("PDF417 module width must be in 2..8, got " + std::to_string(width));
        }
    }

    void Pdf417Option::validateRowHeight(uint8_t rowHeight) {
        if (rowHeight < 2 || rowHeight > 8) {
            throw types::InputException("PDF417 row height must be in 2..8, got " + std::to_string(rowHeight));
        }
    }

    Pdf417::Pdf417(std::string data, Pdf417Option option)
            : data_(std::move(data)),
              option_(std::move(option)) {}

    const std::string &Pdf417::data() const {
        return data_;
    }

    const Pdf417Option &Pdf417::option() const {
        return option_;
    }

} // namespace escpos::domain::code2d
