#pragma once

#include "escpos/Command.hpp"
#include "escpos/Protocol.hpp"
#include "escpos/domain/barcode/Barcode.hpp"
#include "escpos/domain/code2d/Aztec.hpp"
#include "escpos/domain/code2d/DataMatrix.hpp"
#include "escpos/domain/code2d/GS1DataBar2D.hpp"
#include "escpos/domain/code2d/MaxiCode.hpp"
#include "escpos/domain/code2d/Pdf417.hpp"
#include "escpos/domain/code2d/QRCode.hpp"
#include "escpos/domain/image/BitImage.hpp"
#include "escpos/domain/image/Graphic.hpp"
#include "escpos/domain/status/RealTimeStatus.hpp"
#include "escpos/domain/ui/Line.hpp"
#include "escpos/io/Driver.hpp"
#include "escpos/printer/PrinterOptions.hpp"
#include "escpos/printer/PrinterStyleState.hpp"
#include <memory>
#include <string>
#include <vector>

namespace escpos::printer {

    /**
     * @brief Accoda le istruzioni ESC/POS e le invia al driver con una sola scrittura per flush.
     *
     * Ogni operazione costruisce prima tutti i comandi: se un builder fallisce viene lanciata
     * l'eccezione e la coda resta invariata.
     */
    class Printer {
    public:
        Printer(std::shared_ptr<io::Driver> driver, std::shared_ptr<Protocol> protocol,
                PrinterOptions options = PrinterOptions());

        const Protocol &protocol() const;

        const PrinterOptions &options() const;

        const PrinterStyleState &styleState() const;

        /// Istruzioni in coda, non ancora inviate.
        const std::vector<Instruction> &instructions() const;

        Printer &resetStyleState();

        Printer &debugMode(std::optional<DebugMode> mode);

        /// Con una modalità di debug attiva, registra tutte le istruzioni in coda.
        Printer &debug();

        /**
         * @brief Concatena la coda, una Driver::write seguita da Driver::flush.
         *
         * Coda e stile vengono azzerati anche in caso di errore (al più una consegna per flush).
         * @throws types::TransportException se write o flush falliscono.
         */
        Printer &print();

        // ---------------- Hardware ----------------

        /// ESC @ seguito dalla page code delle opzioni, se presente.
        Printer &init();

        Printer &reset();

        Printer &cut();

        Printer &partialCut();

        /// Taglio completo e print().
        Printer &printCut();

        Printer &pageCode(domain::PageCode code);

        Printer &characterSet(domain::CharacterSet set);

        Printer &feed();

        Printer &feeds(uint8_t lines);

        Printer &lineSpacing(uint8_t value);

        Printer &resetLineSpacing();

        Printer &cashDrawer(domain::CashDrawer pin);

        Printer &motionUnits(uint8_t x, uint8_t y);

        // ---------------- Testo ----------------

        Printer &bold(bool enabled);

        Printer &underline(domain::UnderlineMode mode);

        Printer &doubleStrike(bool enabled);

        Printer &font(domain::Font font);

        Printer &flip(bool enabled);

        Printer &justify(domain::JustifyMode mode);

        Printer &reverse(bool enabled);

        /**
         * @throws types::InputException se width o height non sono in 1..8.
         */
        Printer &size(uint8_t width, uint8_t height);

        Printer &resetSize();

        Printer &smoothing(bool enabled);

        Printer &upsideDown(bool enabled);

        /// Testo codificato con la page code corrente delle opzioni.
        Printer &write(const std::string &text);

        Printer &writeln(const std::string &text);

        /// Byte grezzi, senza alcuna validazione.
        Printer &custom(const Command &cmd);

        Printer &customWithPageCode(const Command &cmd, domain::PageCode code);

        // ---------------- Stato ----------------

        /// Accoda la richiesta DLE EOT e la ricorda per readStatus().
        Printer &realTimeStatus(domain::status::RealTimeStatusRequest request);

        /// Invia le richieste in coda (equivale a print()).
        Printer &sendStatus();

        /**
         * @brief Legge un byte per ogni richiesta inviata, nell'ordine di invio.
         * @throws types::TimeoutException se la stampante non risponde in tempo.
         * @throws types::TransportException per ogni altro errore del driver.
         */
        std::vector<domain::status::RealTimeStatusResponse> readStatus();

        // ---------------- Codici a barre ----------------

        Printer &ean13(const std::string &data,
                       const domain::barcode::BarcodeOption &option = domain::barcode::BarcodeOption());

        Printer &ean8(const std::string &data,
                      const domain::barcode::BarcodeOption &option = domain::barcode::BarcodeOption());

        Printer &upca(const std::string &data,
                      const domain::barcode::BarcodeOption &option = domain::barcode::BarcodeOption());

        Printer &upce(const std::string &data,
                      const domain::barcode::BarcodeOption &option = domain::barcode::BarcodeOption());

        Printer &code39(const std::string &data,
                        const domain::barcode::BarcodeOption &option = domain::barcode::BarcodeOption());

        Printer &codabar(const std::string &data,
                         const domain::barcode::BarcodeOption &option = domain::barcode::BarcodeOption());

        Printer &itf(const std::string &data,
                     const domain::barcode::BarcodeOption &option = domain::barcode::BarcodeOption());

        // ---------------- Codici 2D ----------------

        Printer &qrcode(const std::string &data,
                        const domain::code2d::QRCodeOption &option = domain::code2d::QRCodeOption());

        Printer &pdf417(const std::string &data,
                        const domain::code2d::Pdf417Option &option = domain::code2d::Pdf417Option());

        Printer &gs1DataBar2D(const std::string &data,
                              const domain::code2d::GS1DataBar2DOption &option = domain::code2d::GS1DataBar2DOption());

        Printer &dataMatrix(const std::string &data,
                            const domain::code2d::DataMatrixOption &option = domain::code2d::DataMatrixOption());

        Printer &aztec(const std::string &data,
                       const domain::code2d::AztecOption &option = domain::code2d::AztecOption());

        Printer &maxiCode(const std::string &data,
                          domain::code2d::MaxiCodeMode mode = domain::code2d::MaxiCodeMode::Mode2);

        // ---------------- Immagini e UI ----------------

        /// CAN seguito dall'immagine raster GS v 0.
        Printer &bitImage(const domain::image::DecodedImage &image,
                          const domain::image::BitImageOption &option = domain::image::BitImageOption());

        Printer &graphic(const domain::image::DecodedImage &image,
                         const domain::image::BitImageOption &option = domain::image::BitImageOption(),
                         domain::image::GraphicDensity density = domain::image::GraphicDensity::Low);

        Printer &drawLine(const domain::ui::Line &line);

    private:
        std::shared_ptr<io::Driver> driver_;
        std::shared_ptr<Protocol> protocol_;
        PrinterOptions options_;
        PrinterStyleState styleState_;
        std::vector<Instruction> instructions_;

        // Richieste accodate ma non ancora inviate / inviate e in attesa di risposta
        std::vector<domain::status::RealTimeStatusRequest> queuedStatus_;
        std::vector<domain::status::RealTimeStatusRequest> pendingStatus_;

        Printer &command(const std::string &label, std::vector<Command> commands);

        Printer &barcode(const domain::barcode::Barcode &barcode);

        void flush();
    };

} // namespace escpos::printer
