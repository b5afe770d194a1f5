#pragma once

#include "application/config/ConfigManager.hpp"
#include "escpos/io/Driver.hpp"
#include "escpos/printer/Printer.hpp"
#include <memory>
#include <string>

/**
 * @class ApplicationController
 * @brief Controller della CLI escpos-cli.
 *
 * Carica la configurazione, apre il driver configurato e esegue un comando:
 * - receipt: scontrino dimostrativo (stili di testo, EAN13, QR, linee, taglio)
 * - status: richiesta di stato Printer e RollPaperSensor con decodifica dei flag
 * - image-test: immagine di prova generata, stampata come raster e come grafica
 */
class ApplicationController {
public:
    ApplicationController() = default;

    ~ApplicationController();

    /**
     * @brief Configurazione, logger, driver e stampante.
     * @return false se la configurazione non è valida o il driver non si apre.
     */
    bool initialize(const std::string &configPath);

    /**
     * @return Exit code del processo.
     */
    int run(const std::string &mode);

    void shutdown();

    /**
     * @brief Crea il driver descritto dalla configurazione.
     * @throws escpos::types::TransportException se il trasporto non può essere aperto.
     * @throws escpos::types::InputException per un tipo di driver sconosciuto.
     */
    static std::shared_ptr<escpos::io::Driver> createDriver(const escpos::config::DriverConfig &config);

    /**
     * @brief Opzioni della stampante dalla sezione printer.* (valori non validi ignorati).
     */
    static escpos::printer::PrinterOptions createOptions(const escpos::config::PrinterConfig &config);

private:
    std::shared_ptr<escpos::io::Driver> driver_;
    std::unique_ptr<escpos::printer::Printer> printer_;

    void printReceipt();

    void printStatus();

    void printImageTest();
};
