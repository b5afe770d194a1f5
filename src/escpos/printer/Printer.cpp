#include "escpos/printer/Printer.hpp"
#include "escpos/types/Error.hpp"
#include "logger/Logger.hpp"

namespace escpos::printer {

    using namespace escpos::domain;

    Printer::Printer(std::shared_ptr<io::Driver> driver, std::shared_ptr<Protocol> protocol,
                     PrinterOptions options)
            : driver_(std::move(driver)),
              protocol_(std::move(protocol)),
              options_(options) {
        if (!driver_ || !protocol_) {
            throw types::InputException("printer requires a driver and a protocol");
        }
    }

    const Protocol &Printer::protocol() const {
        return *protocol_;
    }

    const PrinterOptions &Printer::options() const {
        return options_;
    }

    const PrinterStyleState &Printer::styleState() const {
        return styleState_;
    }

    const std::vector<Instruction> &Printer::instructions() const {
        return instructions_;
    }

    Printer &Printer::resetStyleState() {
        styleState_ = PrinterStyleState();
        return *this;
    }

    Printer &Printer::debugMode(std::optional<DebugMode> mode) {
        options_.setDebugMode(mode);
        return *this;
    }

    Printer &Printer::debug() {
        if (options_.debugMode()) {
            for (const auto &instruction: instructions_) {
                Logger::logDebug("[Printer] " + instruction.toString());
            }
        }
        return *this;
    }

    void Printer::flush() {
        Command payload;
        for (const auto &instruction: instructions_) {
            const auto bytes = instruction.flatten();
            payload.insert(payload.end(), bytes.begin(), bytes.end());
        }

        auto sent = std::move(queuedStatus_);
        instructions_.clear();
        queuedStatus_.clear();
        resetStyleState();

        const auto written = driver_->write(payload);
        if (!written.isSuccess()) {
            Logger::logError("[Printer] Write to " + driver_->name() + " failed: " + written.message);
            throw types::TransportException(written.message);
        }

        const auto flushed = driver_->flush();
        if (!flushed.isSuccess()) {
            Logger::logError("[Printer] Flush on " + driver_->name() + " failed: " + flushed.message);
            throw types::TransportException(flushed.message);
        }

        pendingStatus_.insert(pendingStatus_.end(), sent.begin(), sent.end());
        Logger::logDebug("[Printer] Sent " + std::to_string(payload.size()) + " bytes to " + driver_->name());
    }

    Printer &Printer::print() {
        flush();
        if (options_.debugMode()) {
            Logger::logDebug("[Printer] [print]");
        }
        return *this;
    }

    Printer &Printer::command(const std::string &label, std::vector<Command> commands) {
        Instruction instruction(label, std::move(commands), options_.debugMode());
        if (!label.empty() && options_.debugMode()) {
            Logger::logDebug("[Printer] " + instruction.toString());
        }
        instructions_.push_back(std::move(instruction));
        return *this;
    }

    // ---------------- Hardware ----------------

    Printer &Printer::init() {
        command("initialization", {protocol_->hardware()->init()});
        if (const auto code = options_.pageCode()) {
            command("character page code", {protocol_->hardware()->pageCode(*code)});
        }
        return *this;
    }

    Printer &Printer::reset() {
        return command("reset", {protocol_->hardware()->reset()});
    }

    Printer &Printer::cut() {
        return command("full paper cut", {protocol_->hardware()->cut(false)});
    }

    Printer &Printer::partialCut() {
        return command("partial paper cut", {protocol_->hardware()->cut(true)});
    }

    Printer &Printer::printCut() {
        return cut().print();
    }

    Printer &Printer::pageCode(PageCode code) {
        auto cmd = protocol_->hardware()->pageCode(code);
        options_.setPageCode(code);
        return command("character page code", {std::move(cmd)});
    }

    Printer &Printer::characterSet(CharacterSet set) {
        return command("international character set", {protocol_->hardware()->characterSet(set)});
    }

    Printer &Printer::feed() {
        return command("line feed", {protocol_->hardware()->feed(1)});
    }

    Printer &Printer::feeds(uint8_t lines) {
        return command("line feeds", {protocol_->hardware()->feed(lines)});
    }

    Printer &Printer::lineSpacing(uint8_t value) {
        return command("line spacing", {protocol_->hardware()->lineSpacing(value)});
    }

    Printer &Printer::resetLineSpacing() {
        return command("reset line spacing", {protocol_->hardware()->resetLineSpacing()});
    }

    Printer &Printer::cashDrawer(CashDrawer pin) {
        return command("cash drawer", {protocol_->hardware()->cashDrawer(pin)});
    }

    Printer &Printer::motionUnits(uint8_t x, uint8_t y) {
        return command("set motion units", {protocol_->hardware()->motionUnits(x, y)});
    }

    // ---------------- Testo ----------------

    Printer &Printer::bold(bool enabled) {
        auto cmd = protocol_->text()->bold(enabled);
        styleState_.bold = enabled;
        return command("text bold", {std::move(cmd)});
    }

    Printer &Printer::underline(UnderlineMode mode) {
        auto cmd = protocol_->text()->underline(mode);
        styleState_.underline = mode;
        return command("text underline", {std::move(cmd)});
    }

    Printer &Printer::doubleStrike(bool enabled) {
        auto cmd = protocol_->text()->doubleStrike(enabled);
        styleState_.doubleStrike = enabled;
        return command("text double strike", {std::move(cmd)});
    }

    Printer &Printer::font(Font font) {
        auto cmd = protocol_->text()->font(font);
        styleState_.font = font;
        return command("text font", {std::move(cmd)});
    }

    Printer &Printer::flip(bool enabled) {
        auto cmd = protocol_->text()->flip(enabled);
        styleState_.flip = enabled;
        return command("text flip", {std::move(cmd)});
    }

    Printer &Printer::justify(JustifyMode mode) {
        auto cmd = protocol_->text()->justify(mode);
        styleState_.justify = mode;
        return command("text justify", {std::move(cmd)});
    }

    Printer &Printer::reverse(bool enabled) {
        auto cmd = protocol_->text()->reverseColours(enabled);
        styleState_.reverse = enabled;
        return command("text reverse colour", {std::move(cmd)});
    }

    Printer &Printer::size(uint8_t width, uint8_t height) {
        auto cmd = protocol_->text()->textSize(width, height);
        styleState_.textSize = TextSize{width, height};
        return command("text size", {std::move(cmd)});
    }

    Printer &Printer::resetSize() {
        return size(1, 1);
    }

    Printer &Printer::smoothing(bool enabled) {
        return command("smoothing mode", {protocol_->text()->smoothing(enabled)});
    }

    Printer &Printer::upsideDown(bool enabled) {
        return command("upside-down mode", {protocol_->text()->upsideDown(enabled)});
    }

    Printer &Printer::write(const std::string &text) {
        return command("text", {protocol_->text()->text(text, options_.pageCode())});
    }

    Printer &Printer::writeln(const std::string &text) {
        return write(text).feed();
    }

    Printer &Printer::custom(const Command &cmd) {
        return command("custom command", {cmd});
    }

    Printer &Printer::customWithPageCode(const Command &cmd, PageCode code) {
        pageCode(code);
        return command("custom command with page code " + toString(code), {cmd});
    }

    // ---------------- Stato ----------------

    Printer &Printer::realTimeStatus(status::RealTimeStatusRequest request) {
        command("real-time status " + status::toString(request), {protocol_->status()->realTimeStatus(request)});
        queuedStatus_.push_back(request);
        return *this;
    }

    Printer &Printer::sendStatus() {
        flush();
        if (options_.debugMode()) {
            Logger::logDebug("[Printer] [send printer status]");
        }
        return *this;
    }

    std::vector<status::RealTimeStatusResponse> Printer::readStatus() {
        auto requests = std::move(pendingStatus_);
        pendingStatus_.clear();

        std::vector<status::RealTimeStatusResponse> responses;
        responses.reserve(requests.size());

        for (const auto request: requests) {
            std::vector<uint8_t> buffer(1);
            const auto result = driver_->read(buffer);

            if (result.isTimeout()) {
                Logger::logWarning("[Printer] No answer to status request " + status::toString(request));
                throw types::TimeoutException();
            }
            if (!result.isSuccess()) {
                Logger::logError("[Printer] Status read from " + driver_->name() + " failed: " + result.message);
                throw types::TransportException(result.message);
            }
            if (result.bytes == 0) {
                throw types::TransportException("connection closed while reading status " +
                                                status::toString(request));
            }

            responses.emplace_back(request, buffer[0]);
        }

        return responses;
    }

    // ---------------- Codici a barre ----------------

    Printer &Printer::barcode(const barcode::Barcode &code) {
        return command("print " + barcode::toString(code.system()) + " barcode",
                       protocol_->barcode()->barcode(code));
    }

    Printer &Printer::ean13(const std::string &data, const barcode::BarcodeOption &option) {
        return barcode(barcode::Barcode(barcode::BarcodeSystem::EAN13, data, option));
    }

    Printer &Printer::ean8(const std::string &data, const barcode::BarcodeOption &option) {
        return barcode(barcode::Barcode(barcode::BarcodeSystem::EAN8, data, option));
    }

    Printer &Printer::upca(const std::string &data, const barcode::BarcodeOption &option) {
        return barcode(barcode::Barcode(barcode::BarcodeSystem::UPCA, data, option));
    }

    Printer &Printer::upce(const std::string &data, const barcode::BarcodeOption &option) {
        return barcode(barcode::Barcode(barcode::BarcodeSystem::UPCE, data, option));
    }

    Printer &Printer::code39(const std::string &data, const barcode::BarcodeOption &option) {
        return barcode(barcode::Barcode(barcode::BarcodeSystem::CODE39, data, option));
    }

    Printer &Printer::codabar(const std::string &data, const barcode::BarcodeOption &option) {
        return barcode(barcode::Barcode(barcode::BarcodeSystem::CODABAR, data, option));
    }

    Printer &Printer::itf(const std::string &data, const barcode::BarcodeOption &option) {
        return barcode(barcode::Barcode(barcode::BarcodeSystem::ITF, data, option));
    }

    // ---------------- Codici 2D ----------------

    Printer &Printer::qrcode(const std::string &data, const code2d::QRCodeOption &option) {
        return command("print qrcode", protocol_->qrcode()->qrcode(code2d::QRCode(data, option)));
    }

    Printer &Printer::pdf417(const std::string &data, const code2d::Pdf417Option &option) {
        return command("print PDF417", protocol_->pdf417()->pdf417(code2d::Pdf417(data, option)));
    }

    Printer &Printer::gs1DataBar2D(const std::string &data, const code2d::GS1DataBar2DOption &option) {
        return command("print 2D GS1 DataBar",
                       protocol_->gs1DataBar2D()->gs1DataBar2D(code2d::GS1DataBar2D(data, option)));
    }

    Printer &Printer::dataMatrix(const std::string &data, const code2d::DataMatrixOption &option) {
        return command("print DataMatrix", protocol_->dataMatrix()->dataMatrix(code2d::DataMatrix(data, option)));
    }

    Printer &Printer::aztec(const std::string &data, const code2d::AztecOption &option) {
        return command("print Aztec", protocol_->aztec()->aztec(code2d::Aztec(data, option)));
    }

    Printer &Printer::maxiCode(const std::string &data, code2d::MaxiCodeMode mode) {
        return command("print MaxiCode", protocol_->maxiCode()->maxiCode(code2d::MaxiCode(data, mode)));
    }

    // ---------------- Immagini e UI ----------------

    Printer &Printer::bitImage(const image::DecodedImage &source, const image::BitImageOption &option) {
        const image::BitImage bits(source, option);
        auto raster = protocol_->image()->bitImage(bits);

        command("cancel data", {protocol_->hardware()->cancel()});
        return command("print bit image", {std::move(raster)});
    }

    Printer &Printer::graphic(const image::DecodedImage &source, const image::BitImageOption &option,
                              image::GraphicDensity density) {
        const image::BitImage bits(source, option);
        return command("print graphic " + image::toString(density), protocol_->image()->graphic(bits, density));
    }

    Printer &Printer::drawLine(const ui::Line &line) {
        return command("draw line", protocol_->ui()->drawLine(line, options_, styleState_));
    }

} // namespace escpos::printer
