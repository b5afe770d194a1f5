#include "escpos/domain/code2d/DataMatrix.hpp"
#include "escpos/types/Error.hpp"

#include <algorithm>
#include <utility>

namespace escpos::domain::code2d {

    namespace {
        const std::array<uint8_t, 25> SQUARE_SIDES = {
                0, 10, 12, 14, 16, 18, 20, 22, 24, 26, 32, 36, 40, 44, 48, 52, 64, 72, 80, 88, 96, 104, 120, 132, 144
        };

        const std::array<std::pair<uint8_t, uint8_t>, 9> RECTANGLES = {{
                {8, 0}, {8, 18}, {8, 32}, {12, 0}, {12, 26}, {12, 36}, {16, 0}, {16, 36}, {16, 48}
        }};
    }

    DataMatrixType::DataMatrixType()
            : square_(true), d1_(0), d2_(0) {}

    DataMatrixType::DataMatrixType(bool square, uint8_t d1, uint8_t d2)
            : square_(square), d1_(d1), d2_(d2) {}

    DataMatrixType DataMatrixType::square(uint8_t side) {
        if (!isValidSquare(side)) {
            throw types::InputException("DataMatrix square side must be one of 0, 10..26 (even), 32..52 (step 4), "
                                        "64..104 (step 8), 120, 132, 144, got " + std::to_string(side));
        }
        return {true, side, side};
    }

    DataMatrixType DataMatrixType::rectangle(uint8_t rows, uint8_t columns) {
        if (!isValidRectangle(rows, columns)) {
            throw types::InputException("DataMatrix rectangle must be one of (8,0), (8,18), (8,32), (12,0), (12,26), "
                                        "(12,36), (16,0), (16,36), (16,48), got (" + std::to_string(rows) + "," +
                                        std::to_string(columns) + ")");
        }
        return {false, rows, columns};
    }

    bool DataMatrixType::isSquare() const {
        return square_;
    }

    std::array<uint8_t, 3> DataMatrixType::bytes() const {
        return {static_cast<uint8_t>(square_ ? 0 : 1), d1_, d2_};
    }

    bool DataMatrixType::isValidSquare(uint8_t side) {
        return std::find(SQUARE_SIDES.begin(), SQUARE_SIDES.end(), side) != SQUARE_SIDES.end();
    }

    bool DataMatrixType::isValidRectangle(uint8_t rows, uint8_t columns) {
        return std::find(RECTANGLES.begin(), RECTANGLES.end(), std::make_pair(rows, columns)) != RECTANGLES.end();
    }

    DataMatrixOption::DataMatrixOption()
            : type_(), size_(3) {}

    DataMatrixOption::DataMatrixOption(DataMatrixType type, uint8_t size)
            : type_(type), size_(size) {
        if (size_ < 2 || size_ > 16) {
            throw types::InputException("DataMatrix module size must be in 2..16, got " + std::to_string(size_));
        }
    }

    const DataMatrixType &DataMatrixOption::type() const {
        return type_;
    }

    uint8_t DataMatrixOption::size() const {
        return size_;
    }

    DataMatrix::DataMatrix(std::string data, DataMatrixOption option)
            : data_(std::move(data)),
              option_(option) {}

    const std::string &DataMatrix::data() const {
        return data_;
    }

    const DataMatrixOption &DataMatrix::option() const {
        return option_;
    }

} // namespace escpos::domain::code2d
