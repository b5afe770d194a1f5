#include "application/config/ConfigManager.hpp"
#include "escpos/Command.hpp"
#include "escpos/domain/Types.hpp"
#include "logger/Logger.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <utility>

namespace escpos::config {

    namespace {
        // Variabile d'ambiente -> chiave di configurazione
        const std::pair<const char *, const char *> ENV_KEYS[] = {
                {"ESCPOS_DRIVER_TYPE",                "driver.type"},
                {"ESCPOS_FILE_PATH",                  "driver.file.path"},
                {"ESCPOS_NETWORK_HOST",               "driver.network.host"},
                {"ESCPOS_NETWORK_PORT",               "driver.network.port"},
                {"ESCPOS_SERIAL_DEVICE",              "driver.serial.device"},
                {"ESCPOS_SERIAL_BAUDRATE",            "driver.serial.baudrate"},
                {"ESCPOS_READ_TIMEOUT_MS",            "driver.read.timeout.ms"},
                {"ESCPOS_PRINTER_PAGE_CODE",          "printer.page.code"},
                {"ESCPOS_PRINTER_DEBUG_MODE",         "printer.debug.mode"},
                {"ESCPOS_PRINTER_CHARACTERS_PER_LINE", "printer.characters.per.line"},
                {"ESCPOS_PRINTER_CHARSET",            "printer.charset"},
                {"ESCPOS_LOG_FOLDER",                 "logging.folder"},
                {"ESCPOS_LOG_LEVEL",                  "logging.level"},
        };

        void flatten(const nlohmann::json &obj, const std::string &prefix,
                     std::unordered_map<std::string, std::string> &out) {
            for (auto it = obj.begin(); it != obj.end(); ++it) {
                std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

                if (it.value().is_object()) {
                    flatten(it.value(), key, out);
                } else if (it.value().is_string()) {
                    out[key] = it.value().get<std::string>();
                } else if (it.value().is_null()) {
                    out[key] = "";
                } else {
                    out[key] = it.value().dump();
                }
            }
        }
    }

    ConfigManager::ConfigManager() {
        setDefaults();
    }

    ConfigManager &ConfigManager::getInstance() {
        static ConfigManager instance;
        return instance;
    }

    void ConfigManager::loadFromFile(const std::string &configPath) {
        if (!std::filesystem::exists(configPath)) {
            Logger::logWarning("[ConfigManager] Config file not found: " + configPath + ", using defaults");
            return;
        }

        std::ifstream file(configPath);
        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (loadFromString(content)) {
            Logger::logInfo("[ConfigManager] Loaded settings from " + configPath);
        }
    }

    bool ConfigManager::loadFromString(const std::string &content) {
        std::unordered_map<std::string, std::string> loaded;
        try {
            const auto json = nlohmann::json::parse(content);
            if (!json.is_object()) {
                Logger::logError("[ConfigManager] Config root must be a JSON object");
                return false;
            }
            flatten(json, "", loaded);
        } catch (const nlohmann::json::exception &e) {
            Logger::logError("[ConfigManager] Failed to parse config: " + std::string(e.what()));
            return false;
        }

        std::lock_guard<std::mutex> lock(configMutex_);
        for (auto &[key, value]: loaded) {
            config_[key] = std::move(value);
        }
        return true;
    }

    void ConfigManager::loadFromEnv() {
        std::lock_guard<std::mutex> lock(configMutex_);

        int loaded = 0;
        for (const auto &[envVar, key]: ENV_KEYS) {
            const char *value = std::getenv(envVar);
            if (value) {
                config_[key] = value;
                loaded++;
            }
        }

        Logger::logInfo("[ConfigManager] Loaded " + std::to_string(loaded) + " settings from environment");
    }

    void ConfigManager::reset() {
        std::lock_guard<std::mutex> lock(configMutex_);
        setDefaults();
    }

    void ConfigManager::set(const std::string &key, const std::string &value) {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_[key] = value;
    }

    DriverConfig ConfigManager::getDriverConfig() const {
        DriverConfig config;
        config.type = get<std::string>("driver.type", config.type);
        config.filePath = get<std::string>("driver.file.path", config.filePath);
        config.networkHost = get<std::string>("driver.network.host", config.networkHost);
        config.networkPort = get<int>("driver.network.port", config.networkPort);
        config.serialDevice = get<std::string>("driver.serial.device", config.serialDevice);
        config.serialBaudrate = get<int>("driver.serial.baudrate", config.serialBaudrate);
        config.readTimeoutMs = get<int>("driver.read.timeout.ms", config.readTimeoutMs);
        return config;
    }

    PrinterConfig ConfigManager::getPrinterConfig() const {
        PrinterConfig config;
        config.pageCode = get<std::string>("printer.page.code", config.pageCode);
        config.debugMode = get<std::string>("printer.debug.mode", config.debugMode);
        config.charactersPerLine = get<int>("printer.characters.per.line", config.charactersPerLine);
        config.charset = get<std::string>("printer.charset", config.charset);
        config.strictEncoding = get<bool>("printer.strict.encoding", config.strictEncoding);
        return config;
    }

    LoggingConfig ConfigManager::getLoggingConfig() const {
        LoggingConfig config;
        config.folder = get<std::string>("logging.folder", config.folder);
        config.level = get<std::string>("logging.level", config.level);
        return config;
    }

    ConfigManager::ValidationResult ConfigManager::validate() const {
        ValidationResult result;

        const auto driver = getDriverConfig();
        if (driver.type != "console" && driver.type != "file" && driver.type != "network" &&
            driver.type != "serial") {
            result.errors.push_back("driver.type must be one of console, file, network, serial (got '" +
                                    driver.type + "')");
        }

        if (driver.type == "file" && driver.filePath.empty()) {
            result.errors.push_back("driver.file.path must not be empty");
        }

        if (driver.networkPort < 1 || driver.networkPort > 65535) {
            result.errors.push_back("driver.network.port must be in 1..65535");
        }

        if (driver.serialBaudrate <= 0) {
            result.errors.push_back("driver.serial.baudrate must be > 0");
        }

        if (driver.readTimeoutMs < 0) {
            result.errors.push_back("driver.read.timeout.ms must be >= 0");
        }

        const auto printer = getPrinterConfig();
        if (!printer.pageCode.empty() && !domain::pageCodeFromString(printer.pageCode)) {
            result.errors.push_back("printer.page.code is not a known page code: " + printer.pageCode);
        }

        if (!printer.debugMode.empty() && !debugModeFromString(printer.debugMode)) {
            result.errors.push_back("printer.debug.mode must be hex or dec");
        }

        if (printer.charactersPerLine < 1 || printer.charactersPerLine > 255) {
            result.errors.push_back("printer.characters.per.line must be in 1..255");
        }

        result.isValid = result.errors.empty();
        return result;
    }

    void ConfigManager::setDefaults() {
        config_.clear();

        // Driver defaults
        config_["driver.type"] = "console";
        config_["driver.file.path"] = "receipt.bin";
        config_["driver.network.host"] = "127.0.0.1";
        config_["driver.network.port"] = "9100";
        config_["driver.serial.device"] = "/dev/ttyUSB0";
        config_["driver.serial.baudrate"] = "9600";
        config_["driver.read.timeout.ms"] = "2000";

        // Printer defaults
        config_["printer.page.code"] = "";
        config_["printer.debug.mode"] = "";
        config_["printer.characters.per.line"] = "42";
        config_["printer.charset"] = "UTF-8";
        config_["printer.strict.encoding"] = "false";

        // Logging defaults
        config_["logging.folder"] = "";
        config_["logging.level"] = "info";
    }

} // namespace escpos::config
