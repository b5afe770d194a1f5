#include "application/controllers/ApplicationController.hpp"
#include "escpos/io/ConsoleDriver.hpp"
#include "escpos/io/FileDriver.hpp"
#include "escpos/io/NetworkDriver.hpp"
#include "escpos/io/SerialPortDriver.hpp"
#include "escpos/types/Error.hpp"
#include "logger/Logger.hpp"

using namespace escpos;
using namespace escpos::domain;

ApplicationController::~ApplicationController() {
    shutdown();
}

bool ApplicationController::initialize(const std::string &configPath) {
    auto &config = config::ConfigManager::getInstance();
    config.loadFromFile(configPath);
    config.loadFromEnv();

    const auto logging = config.getLoggingConfig();
    Logger::init(logging.folder, Logger::levelFromString(logging.level));

    const auto validation = config.validate();
    if (!validation.isValid) {
        for (const auto &error: validation.errors) {
            Logger::logError("[ApplicationController] Invalid configuration: " + error);
        }
        return false;
    }

    const auto printerConfig = config.getPrinterConfig();
    if (!printerConfig.debugMode.empty()) {
        Logger::setLevel(LogLevel::Debug);
    }

    try {
        driver_ = createDriver(config.getDriverConfig());
        encoder::TextEncoder textEncoder(printerConfig.charset,
                                         printerConfig.strictEncoding ? encoder::UnmappablePolicy::Strict
                                                                      : encoder::UnmappablePolicy::Replace);
        printer_ = std::make_unique<printer::Printer>(driver_, std::make_shared<Protocol>(textEncoder),
                                                      createOptions(printerConfig));
    } catch (const types::PrinterException &e) {
        Logger::logError("[ApplicationController] Initialization failed: " + std::string(e.what()));
        return false;
    }

    Logger::logInfo("[ApplicationController] Ready on driver " + driver_->name());
    return true;
}

int ApplicationController::run(const std::string &mode) {
    if (!printer_) {
        Logger::logError("[ApplicationController] Not initialized");
        return 1;
    }

    try {
        if (mode == "receipt") {
            printReceipt();
        } else if (mode == "status") {
            printStatus();
        } else if (mode == "image-test") {
            printImageTest();
        } else {
            Logger::logError("[ApplicationController] Unknown command: " + mode +
                             " (expected receipt, status or image-test)");
            return 2;
        }
    } catch (const types::PrinterException &e) {
        Logger::logError("[ApplicationController] " + mode + " failed: " + std::string(e.what()));
        return 1;
    }

    return 0;
}

void ApplicationController::shutdown() {
    printer_.reset();
    driver_.reset();
}

std::shared_ptr<io::Driver> ApplicationController::createDriver(const config::DriverConfig &config) {
    const auto timeout = static_cast<uint32_t>(config.readTimeoutMs);

    if (config.type == "console") {
        return std::make_shared<io::ConsoleDriver>();
    }
    if (config.type == "file") {
        return std::make_shared<io::FileDriver>(config.filePath);
    }
    if (config.type == "network") {
        return std::make_shared<io::NetworkDriver>(config.networkHost, static_cast<uint16_t>(config.networkPort),
                                                   timeout);
    }
    if (config.type == "serial") {
        return std::make_shared<io::SerialPortDriver>(config.serialDevice,
                                                      static_cast<uint32_t>(config.serialBaudrate), timeout);
    }
    throw types::InputException("unknown driver type: " + config.type);
}

printer::PrinterOptions ApplicationController::createOptions(const config::PrinterConfig &config) {
    printer::PrinterOptions options;
    if (!config.pageCode.empty()) {
        options.setPageCode(pageCodeFromString(config.pageCode));
    }
    if (!config.debugMode.empty()) {
        options.setDebugMode(debugModeFromString(config.debugMode));
    }
    if (config.charactersPerLine > 0 && config.charactersPerLine <= 255) {
        options.setCharactersPerLine(static_cast<uint8_t>(config.charactersPerLine));
    }
    return options;
}

void ApplicationController::printReceipt() {
    const auto dashed = ui::LineBuilder().style(ui::LineStyle::Kind::Dashed).build();
    const auto doubleLine = ui::LineBuilder().style(ui::LineStyle::Kind::Double).build();

    printer_->init()
            .justify(JustifyMode::Center)
            .bold(true)
            .size(2, 2)
            .writeln("ESC/POS")
            .resetSize()
            .bold(false)
            .writeln("Receipt demo")
            .drawLine(doubleLine)
            .justify(JustifyMode::Left)
            .writeln("Espresso                 1.20")
            .writeln("Croissant                1.50")
            .underline(UnderlineMode::Single)
            .writeln("Water                    0.80")
            .underline(UnderlineMode::None)
            .drawLine(dashed)
            .doubleStrike(true)
            .writeln("TOTAL                    3.50")
            .doubleStrike(false)
            .feed()
            .justify(JustifyMode::Center)
            .ean13("5901234123457")
            .feed()
            .qrcode("https://example.com/receipt/0001")
            .feeds(3)
            .printCut();
}

void ApplicationController::printStatus() {
    printer_->realTimeStatus(status::RealTimeStatusRequest::Printer)
            .realTimeStatus(status::RealTimeStatusRequest::RollPaperSensor)
            .sendStatus();

    for (const auto &response: printer_->readStatus()) {
        Logger::logInfo("[ApplicationController] " + status::toString(response.request()) + ":");
        for (const auto &[flag, value]: response.decode()) {
            Logger::logInfo("  " + status::toString(flag) + " = " + (value ? "true" : "false"));
        }
    }
}

void ApplicationController::printImageTest() {
    const uint32_t width = 256;
    const uint32_t height = 128;
    image::RgbaImage pattern(width, height);

    // Scacchiera a sinistra, gradiente orizzontale a destra
    for (uint32_t y = 0; y < height; ++y) {
        for (uint32_t x = 0; x < width; ++x) {
            if (x < width / 2) {
                const bool dark = ((x / 16) + (y / 16)) % 2 == 0;
                const uint8_t v = dark ? 0 : 255;
                pattern.setPixel(x, y, {v, v, v, 255});
            } else {
                const auto v = static_cast<uint8_t>(255 * (x - width / 2) / (width / 2));
                pattern.setPixel(x, y, {v, v, v, 255});
            }
        }
    }

    printer_->init()
            .justify(JustifyMode::Center)
            .writeln("Raster bit image")
            .bitImage(pattern)
            .feed()
            .writeln("Graphic 180dpi")
            .graphic(pattern, image::BitImageOption(), image::GraphicDensity::Low)
            .feeds(3)
            .printCut();
}
