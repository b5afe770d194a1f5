#pragma once

#include <cstdint>
#include <string>

namespace escpos::domain::barcode {

    /// Simbologia 1D (funzione B di GS k). Il valore è l'ordinale m.
    enum class BarcodeSystem : uint8_t {
        UPCA = 0,
        UPCE = 1,
        EAN13 = 2,
        EAN8 = 3,
        CODE39 = 4,
        ITF = 5,
        CODABAR = 6
    };

    enum class BarcodeWidth {
        XS,
        S,
        M,
        L,
        XL
    };

    enum class BarcodeHeight {
        XS,
        S,
        M,
        L,
        XL
    };

    enum class BarcodeFont : uint8_t {
        A = 0,
        B = 1,
        C = 2,
        D = 3,
        E = 4
    };

    /// Posizione dei caratteri HRI.
    enum class BarcodePosition : uint8_t {
        None = 0,
        Above = 1,
        Below = 2,
        Both = 3
    };

    struct BarcodeOption {
        BarcodeWidth width = BarcodeWidth::M;
        BarcodeHeight height = BarcodeHeight::S;
        BarcodeFont font = BarcodeFont::A;
        BarcodePosition position = BarcodePosition::Below;
    };

    uint8_t widthValue(BarcodeWidth width);

    uint8_t heightValue(BarcodeHeight height);

    std::string toString(BarcodeSystem system);

    /**
     * @brief Payload 1D validato contro le regole della simbologia.
     */
    class Barcode {
    public:
        /**
         * @throws types::InputException se il payload non rispetta la simbologia.
         */
        Barcode(BarcodeSystem system, std::string data, BarcodeOption option = BarcodeOption());

        BarcodeSystem system() const;

        const std::string &data() const;

        const BarcodeOption &option() const;

        static bool isValid(BarcodeSystem system, const std::string &data);

        /**
         * @throws types::InputException con il nome della simbologia e il payload rifiutato.
         */
        static void validate(BarcodeSystem system, const std::string &data);

    private:
        BarcodeSystem system_;
        std::string data_;
        BarcodeOption option_;
    };

} // namespace escpos::domain::barcode
