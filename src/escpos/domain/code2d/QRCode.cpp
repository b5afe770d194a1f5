#include "escpos/domain/code2d/QRCode.hpp"
#include "escpos/Constants.hpp"
#include "escpos/types/Error.hpp"

namespace escpos::domain::code2d {

    QRCode::QRCode(std::string data, QRCodeOption option)
            : data_(std::move(data)),
              option_(option) {
        if (data_.size() > constants::QRCODE_MAX_DATA_LENGTH) {
            throw types::InputException("QR code data length must be at most " +
                                        std::to_string(constants::QRCODE_MAX_DATA_LENGTH) + " bytes, got " +
                                        std::to_string(data_.size()));
        }
    }

    const std::string &QRCode::data() const {
        return data_;
    }

    const QRCodeOption &QRCode::option() const {
        return option_;
    }

} // namespace escpos::domain::code2d
