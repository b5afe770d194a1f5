#include "escpos/Protocol.hpp"

namespace escpos {

    Protocol::Protocol(encoder::TextEncoder encoder)
            : encoder_(std::move(encoder)),
              hardware_(std::make_shared<command::hardware::HardwareCommands>(this)),
              text_(std::make_shared<command::text::TextCommands>(this)),
              barcode_(std::make_shared<command::barcode::BarcodeCommands>(this)),
              qrcode_(std::make_shared<command::code2d::QRCodeCommands>(this)),
              pdf417_(std::make_shared<command::code2d::Pdf417Commands>(this)),
              gs1DataBar2D_(std::make_shared<command::code2d::GS1DataBar2DCommands>(this)),
              dataMatrix_(std::make_shared<command::code2d::DataMatrixCommands>(this)),
              aztec_(std::make_shared<command::code2d::AztecCommands>(this)),
              maxiCode_(std::make_shared<command::code2d::MaxiCodeCommands>(this)),
              image_(std::make_shared<command::image::ImageCommands>(this)),
              status_(std::make_shared<command::status::StatusCommands>(this)),
              ui_(std::make_shared<command::ui::UiCommands>(this)) {
    }

    const encoder::TextEncoder &Protocol::encoder() const {
        return encoder_;
    }

    std::shared_ptr<command::hardware::HardwareCommands> Protocol::hardware() const {
        return hardware_;
    }

    std::shared_ptr<command::text::TextCommands> Protocol::text() const {
        return text_;
    }

    std::shared_ptr<command::barcode::BarcodeCommands> Protocol::barcode() const {
        return barcode_;
    }

    std::shared_ptr<command::code2d::QRCodeCommands> Protocol::qrcode() const {
        return qrcode_;
    }

    std::shared_ptr<command::code2d::Pdf417Commands> Protocol::pdf417() const {
        return pdf417_;
    }

    std::shared_ptr<command::code2d::GS1DataBar2DCommands> Protocol::gs1DataBar2D() const {
        return gs1DataBar2D_;
    }

    std::shared_ptr<command::code2d::DataMatrixCommands> Protocol::dataMatrix() const {
        return dataMatrix_;
    }

    std::shared_ptr<command::code2d::AztecCommands> Protocol::aztec() const {
        return aztec_;
    }

    std::shared_ptr<command::code2d::MaxiCodeCommands> Protocol::maxiCode() const {
        return maxiCode_;
    }

    std::shared_ptr<command::image::ImageCommands> Protocol::image() const {
        return image_;
    }

    std::shared_ptr<command::status::StatusCommands> Protocol::status() const {
        return status_;
    }

    std::shared_ptr<command::ui::UiCommands> Protocol::ui() const {
        return ui_;
    }

} // namespace escpos
