#pragma once

#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace escpos::config {

    struct DriverConfig {
        std::string type = "console"; // console | file | network | serial
        std::string filePath = "receipt.bin";
        std::string networkHost = "127.0.0.1";
        int networkPort = 9100;
        std::string serialDevice = "/dev/ttyUSB0";
        int serialBaudrate = 9600;
        int readTimeoutMs = 2000;
    };

    struct PrinterConfig {
        std::string pageCode;  // vuoto = nessuna page code
        std::string debugMode; // vuoto, "hex" o "dec"
        int charactersPerLine = 42;
        std::string charset = "UTF-8";
        bool strictEncoding = false;
    };

    struct LoggingConfig {
        std::string folder; // vuoto = solo console
        std::string level = "info";
    };

    /**
     * @brief Configurazione a chiavi puntate (driver.network.host, ...) da JSON e variabili d'ambiente.
     */
    class ConfigManager {
    public:
        static ConfigManager &getInstance();

        // Load configuration
        void loadFromFile(const std::string &configPath = "config.json");

        /**
         * @brief Carica un documento JSON già in memoria.
         * @return false se il testo non è JSON valido (la configurazione resta invariata).
         */
        bool loadFromString(const std::string &content);

        void loadFromEnv();

        /// Ripristina i valori di default.
        void reset();

        void set(const std::string &key, const std::string &value);

        // Configuration access
        DriverConfig getDriverConfig() const;

        PrinterConfig getPrinterConfig() const;

        LoggingConfig getLoggingConfig() const;

        // Generic getters with defaults
        template<typename T>
        T get(const std::string &key, const T &defaultValue) const;

        // Validation
        struct ValidationResult {
            bool isValid = true;
            std::vector<std::string> errors;
        };

        ValidationResult validate() const;

    private:
        ConfigManager();

        mutable std::mutex configMutex_;
        std::unordered_map<std::string, std::string> config_;

        void setDefaults();
    };

    // Template specializations
    template<>
    inline int ConfigManager::get<int>(const std::string &key, const int &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        try {
            return std::stoi(it->second);
        } catch (const std::logic_error &) {
            return defaultValue;
        }
    }

    template<>
    inline std::string ConfigManager::get<std::string>(const std::string &key, const std::string &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        return (it != config_.end()) ? it->second : defaultValue;
    }

    template<>
    inline bool ConfigManager::get<bool>(const std::string &key, const bool &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        return it->second == "true" || it->second == "1";
    }

} // namespace escpos::config
