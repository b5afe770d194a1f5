#pragma once

#include "escpos/io/Driver.hpp"
#include <fstream>
#include <mutex>

namespace escpos::io {

/**
 * @brief Scrive i comandi in un file binario o in un device file (es. /dev/usb/lp0).
 */
    class FileDriver : public Driver {
    public:
        /**
         * @throws types::TransportException se il file non può essere aperto.
         */
        explicit FileDriver(const std::string &path);

        ~FileDriver() override;

        std::string name() const override;

        const std::string &path() const;

        types::Result write(const std::vector<uint8_t> &data) override;

        /// Lettura non supportata da un file di output: sempre Error.
        types::Result read(std::vector<uint8_t> &buffer) override;

        types::Result flush() override;

    private:
        std::string path_;
        std::ofstream file_;
        std::mutex mutex_;
    };

} // namespace escpos::io
