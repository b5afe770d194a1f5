#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace escpos::domain::code2d {

    enum class Pdf417Type : uint8_t {
        Standard = 0,
        Truncated = 1
    };

    /**
     * @brief Livello di correzione PDF417: livello fisso 0..8 oppure rapporto 1..40.
     */
    class Pdf417CorrectionLevel {
    public:
        /// Default: rapporto 1.
        Pdf417CorrectionLevel();

        /// @throws types::InputException se level > 8.
        static Pdf417CorrectionLevel level(uint8_t level);

        /// @throws types::InputException se ratio non è in 1..40.
        static Pdf417CorrectionLevel ratio(uint8_t ratio);

        bool isRatio() const;

        uint8_t value() const;

        /// Coppia (m, n) del comando: (0x30, 0x30 + livello) oppure (0x31, rapporto).
        std::pair<uint8_t, uint8_t> bytes() const;

    private:
        Pdf417CorrectionLevel(bool ratio, uint8_t value);

        bool ratio_;
        uint8_t value_;
    };

    class Pdf417Option {
    public:
        Pdf417Option();

        /**
         * @throws types::InputException se un campo è fuori range.
         */
        Pdf417Option(uint8_t columns, uint8_t rows, uint8_t width, uint8_t rowHeight,
                     Pdf417Type type, Pdf417CorrectionLevel correctionLevel);

        uint8_t columns() const;

        uint8_t rows() const;

        uint8_t width() const;

        uint8_t rowHeight() const;

        Pdf417Type type() const;

        const Pdf417CorrectionLevel &correctionLevel() const;

        static void validateColumns(uint8_t columns);

        static void validateRows(uint8_t rows);

        static void validateWidth(uint8_t width);

        static void validateRowHeight(uint8_t rowHeight);

    private:
        uint8_t columns_;
        uint8_t rows_;
        uint8_t width_;
        uint8_t rowHeight_;
        Pdf417Type type_;
        Pdf417CorrectionLevel correctionLevel_;
    };

    class Pdf417 {
    public:
        Pdf417(std::string data, Pdf417Option option = Pdf417Option());

        const std::string &data() const;

        const Pdf417Option &option() const;

    private:
        std::string data_;
        Pdf417Option option_;
    };

} // namespace escpos::domain::code2d
