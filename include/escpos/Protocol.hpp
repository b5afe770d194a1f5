#pragma once

#include "escpos/command/barcode/BarcodeCommands.hpp"
#include "escpos/command/code2d/AztecCommands.hpp"
#include "escpos/command/code2d/DataMatrixCommands.hpp"
#include "escpos/command/code2d/GS1DataBar2DCommands.hpp"
#include "escpos/command/code2d/MaxiCodeCommands.hpp"
#include "escpos/command/code2d/Pdf417Commands.hpp"
#include "escpos/command/code2d/QRCodeCommands.hpp"
#include "escpos/command/hardware/HardwareCommands.hpp"
#include "escpos/command/image/ImageCommands.hpp"
#include "escpos/command/status/StatusCommands.hpp"
#include "escpos/command/text/TextCommands.hpp"
#include "escpos/command/ui/UiCommands.hpp"
#include "escpos/encoder/TextEncoder.hpp"
#include <memory>

namespace escpos {

    /**
     * @brief Façade del linguaggio ESC/POS: una categoria di comandi per famiglia di funzioni.
     *
     * Tutti i builder sono senza stato; l'unico stato condiviso è l'encoder del testo.
     */
    class Protocol {
    public:
        explicit Protocol(encoder::TextEncoder encoder = encoder::TextEncoder());

        Protocol(const Protocol &) = delete;

        Protocol &operator=(const Protocol &) = delete;

        const encoder::TextEncoder &encoder() const;

        std::shared_ptr<command::hardware::HardwareCommands> hardware() const;

        std::shared_ptr<command::text::TextCommands> text() const;

        std::shared_ptr<command::barcode::BarcodeCommands> barcode() const;

        std::shared_ptr<command::code2d::QRCodeCommands> qrcode() const;

        std::shared_ptr<command::code2d::Pdf417Commands> pdf417() const;

        std::shared_ptr<command::code2d::GS1DataBar2DCommands> gs1DataBar2D() const;

        std::shared_ptr<command::code2d::DataMatrixCommands> dataMatrix() const;

        std::shared_ptr<command::code2d::AztecCommands> aztec() const;

        std::shared_ptr<command::code2d::MaxiCodeCommands> maxiCode() const;

        std::shared_ptr<command::image::ImageCommands> image() const;

        std::shared_ptr<command::status::StatusCommands> status() const;

        std::shared_ptr<command::ui::UiCommands> ui() const;

    private:
        encoder::TextEncoder encoder_;

        std::shared_ptr<command::hardware::HardwareCommands> hardware_;
        std::shared_ptr<command::text::TextCommands> text_;
        std::shared_ptr<command::barcode::BarcodeCommands> barcode_;
        std::shared_ptr<command::code2d::QRCodeCommands> qrcode_;
        std::shared_ptr<command::code2d::Pdf417Commands> pdf417_;
        std::shared_ptr<command::code2d::GS1DataBar2DCommands> gs1DataBar2D_;
        std::shared_ptr<command::code2d::DataMatrixCommands> dataMatrix_;
        std::shared_ptr<command::code2d::AztecCommands> aztec_;
        std::shared_ptr<command::code2d::MaxiCodeCommands> maxiCode_;
        std::shared_ptr<command::image::ImageCommands> image_;
        std::shared_ptr<command::status::StatusCommands> status_;
        std::shared_ptr<command::ui::UiCommands> ui_;
    };

} // namespace escpos
