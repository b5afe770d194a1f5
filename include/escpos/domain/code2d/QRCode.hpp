#pragma once

#include <cstdint>
#include <string>

namespace escpos::domain::code2d {

    enum class QRCodeModel : uint8_t {
        Model1 = 0x31,
        Model2 = 0x32,
        Micro = 0x33
    };

    enum class QRCodeCorrectionLevel : uint8_t {
        L = 0x30,
        M = 0x31,
        Q = 0x32,
        H = 0x33
    };

    struct QRCodeOption {
        QRCodeModel model = QRCodeModel::Model1;
        uint8_t size = 4;
        QRCodeCorrectionLevel correctionLevel = QRCodeCorrectionLevel::H;
    };

    /**
     * @brief Payload del QR code, al massimo 7089 byte.
     */
    class QRCode {
    public:
        QRCode(std::string data, QRCodeOption option = QRCodeOption());

        const std::string &data() const;

        const QRCodeOption &option() const;

    private:
        std::string data_;
        QRCodeOption option_;
    };

} // namespace escpos::domain::code2d
