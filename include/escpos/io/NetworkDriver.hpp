#pragma once

#include "escpos/io/Driver.hpp"
#include <boost/asio.hpp>
#include <cstdint>
#include <mutex>

namespace escpos::io {

/**
 * @brief Stampante di rete (raw TCP, tipicamente porta 9100) su Boost.Asio.
 */
    class NetworkDriver : public Driver {
    public:
        /**
         * @throws types::TransportException se la connessione fallisce.
         */
        NetworkDriver(const std::string &host, uint16_t port, uint32_t readTimeoutMs = 2000);

        ~NetworkDriver() override;

        std::string name() const override;

        types::Result write(const std::vector<uint8_t> &data) override;

        types::Result read(std::vector<uint8_t> &buffer) override;

        /// TCP non bufferizza lato applicazione: nessuna operazione.
        types::Result flush() override;

    private:
        std::string host_;
        uint16_t port_;
        uint32_t readTimeoutMs_;

        boost::asio::io_context io_context_;
        boost::asio::ip::tcp::socket socket_;
        std::mutex mutex_;
    };

} // namespace escpos::io
