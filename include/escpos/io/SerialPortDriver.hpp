#pragma once

#include "escpos/io/Driver.hpp"
#include <boost/asio.hpp>
#include <cstdint>
#include <memory>
#include <mutex>

namespace escpos::io {

/**
 * @brief Stampante su porta seriale (8N1) tramite Boost.Asio.
 */
    class SerialPortDriver : public Driver {
    public:
        /**
         * @throws types::TransportException se la porta non può essere aperta.
         */
        SerialPortDriver(const std::string &portName, uint32_t baudrate, uint32_t readTimeoutMs = 2000);

        ~SerialPortDriver() override;

        std::string name() const override;

        types::Result write(const std::vector<uint8_t> &data) override;

        types::Result read(std::vector<uint8_t> &buffer) override;

        /// Attende lo svuotamento del buffer di uscita (tcdrain).
        types::Result flush() override;

    private:
        std::string portName_;
        uint32_t readTimeoutMs_;

        boost::asio::io_context io_context_;
        std::unique_ptr<boost::asio::serial_port> serial_port_;
        std::mutex mutex_;

        void configurePort(uint32_t baudrate);
    };

} // namespace escpos::io
