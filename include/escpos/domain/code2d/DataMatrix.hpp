#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace escpos::domain::code2d {

    /**
     * @brief Forma e dimensioni di un simbolo DataMatrix.
     *
     * Quadrato: lato in {0,10,12,...,144} (0 = automatico).
     * Rettangolo: coppia (righe, colonne) tra le 9 ammesse.
     */
    class DataMatrixType {
    public:
        /// Default: quadrato automatico.
        DataMatrixType();

        static DataMatrixType square(uint8_t side);

        static DataMatrixType rectangle(uint8_t rows, uint8_t columns);

        bool isSquare() const;

        /// Byte (m, d1, d2) del comando.
        std::array<uint8_t, 3> bytes() const;

        static bool isValidSquare(uint8_t side);

        static bool isValidRectangle(uint8_t rows, uint8_t columns);

    private:
        DataMatrixType(bool square, uint8_t d1, uint8_t d2);

        bool square_;
        uint8_t d1_;
        uint8_t d2_;
    };

    class DataMatrixOption {
    public:
        DataMatrixOption();

        /// @throws types::InputException se la dimensione modulo non è in 2..16.
        DataMatrixOption(DataMatrixType type, uint8_t size);

        const DataMatrixType &type() const;

        uint8_t size() const;

    private:
        DataMatrixType type_;
        uint8_t size_;
    };

    class DataMatrix {
    public:
        DataMatrix(std::string data, DataMatrixOption option = DataMatrixOption());

        const std::string &data() const;

        const DataMatrixOption &option() const;

    private:
        std::string data_;
        DataMatrixOption option_;
    };

} // namespace escpos::domain::code2d
