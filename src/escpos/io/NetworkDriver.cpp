#include "escpos/io/NetworkDriver.hpp"
#include "escpos/types/Error.hpp"
#include "logger/Logger.hpp"

#include <boost/system/error_code.hpp>
#include <chrono>

namespace escpos::io {

    using boost::asio::ip::tcp;

    NetworkDriver::NetworkDriver(const std::string &host, uint16_t port, uint32_t readTimeoutMs)
            : host_(host),
              port_(port),
              readTimeoutMs_(readTimeoutMs),
              io_context_(),
              socket_(io_context_) {
        boost::system::error_code ec;
        tcp::resolver resolver(io_context_);
        const auto endpoints = resolver.resolve(host_, std::to_string(port_), ec);
        if (ec) {
            Logger::logError("[NetworkDriver] Cannot resolve " + host_ + ": " + ec.message());
            throw types::TransportException("cannot resolve " + host_ + ": " + ec.message());
        }

        boost::asio::connect(socket_, endpoints, ec);
        if (ec) {
            Logger::logError("[NetworkDriver] Cannot connect to " + name() + ": " + ec.message());
            throw types::TransportException("cannot connect to " + name() + ": " + ec.message());
        }

        Logger::logInfo("[NetworkDriver] Connected to " + name());
    }

    NetworkDriver::~NetworkDriver() {
        if (socket_.is_open()) {
            boost::system::error_code ec;
            socket_.shutdown(tcp::socket::shutdown_both, ec);
            socket_.close(ec);
            if (ec) {
                Logger::logError("[NetworkDriver] Error closing socket: " + ec.message());
            }
        }
    }

    std::string NetworkDriver::name() const {
        return host_ + ":" + std::to_string(port_);
    }

    types::Result NetworkDriver::write(const std::vector<uint8_t> &data) {
        std::lock_guard<std::mutex> lock(mutex_);

        boost::system::error_code ec;
        const std::size_t written = boost::asio::write(socket_, boost::asio::buffer(data), ec);
        if (ec) {
            Logger::logError("[NetworkDriver] Write error: " + ec.message());
            return types::Result::error("write failed: " + ec.message());
        }
        return types::Result::success("Written", written);
    }

    types::Result NetworkDriver::read(std::vector<uint8_t> &buffer) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (buffer.empty()) {
            return types::Result::success("Nothing to read", 0);
        }

        bool timeout = false;
        boost::system::error_code readError;
        std::size_t received = 0;

        boost::asio::steady_timer timer(io_context_);
        timer.expires_after(std::chrono::milliseconds(readTimeoutMs_));
        timer.async_wait([&](const boost::system::error_code &ec) {
            if (!ec) {
                timeout = true;
                socket_.cancel();
            }
        });

        socket_.async_read_some(boost::asio::buffer(buffer),
                                [&](const boost::system::error_code &ec, std::size_t n) {
                                    readError = ec;
                                    received = n;
                                    timer.cancel();
                                });

        io_context_.restart();
        io_context_.run();

        if (timeout) {
            Logger::logWarning("[NetworkDriver] Read timeout after " + std::to_string(readTimeoutMs_) + "ms");
            return types::Result::timeout("no data from " + name());
        }
        if (readError) {
            Logger::logError("[NetworkDriver] Read error: " + readError.message());
            return types::Result::error("read failed: " + readError.message());
        }
        return types::Result::success("Read", received);
    }

    types::Result NetworkDriver::flush() {
        return types::Result::success("Flushed");
    }

} // namespace escpos::io
