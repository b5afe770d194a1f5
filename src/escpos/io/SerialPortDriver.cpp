#include "escpos/io/SerialPortDriver.hpp"
#include "escpos/types/Error.hpp"
#include "logger/Logger.hpp"

#include <boost/system/error_code.hpp>
#include <chrono>

#ifndef _WIN32
#include <termios.h>
#endif

namespace escpos::io {

    using boost::asio::serial_port_base;

    SerialPortDriver::SerialPortDriver(const std::string &portName, uint32_t baudrate, uint32_t readTimeoutMs)
            : portName_(portName),
              readTimeoutMs_(readTimeoutMs),
              io_context_(),
              serial_port_(nullptr) {
        try {
            serial_port_ = std::make_unique<boost::asio::serial_port>(io_context_, portName_);
        } catch (const boost::system::system_error &e) {
            Logger::logError("[SerialPortDriver] Failed to open " + portName_ + ": " + e.what());
            throw types::TransportException("cannot open serial port " + portName_ + ": " + e.what());
        }

        configurePort(baudrate);
        Logger::logInfo("[SerialPortDriver] Opened " + portName_ + " at " + std::to_string(baudrate) + " baud");
    }

    SerialPortDriver::~SerialPortDriver() {
        if (serial_port_ && serial_port_->is_open()) {
            boost::system::error_code ec;
            serial_port_->close(ec);
            if (ec) {
                Logger::logError("[SerialPortDriver] Error closing port: " + ec.message());
            }
        }
    }

    void SerialPortDriver::configurePort(uint32_t baudrate) {
        boost::system::error_code ec;

        serial_port_->set_option(serial_port_base::baud_rate(baudrate), ec);
        if (ec) {
            Logger::logWarning("[SerialPortDriver] Failed to set baud rate: " + ec.message());
        }

        serial_port_->set_option(serial_port_base::character_size(8), ec);
        if (ec) {
            Logger::logWarning("[SerialPortDriver] Failed to set character size: " + ec.message());
        }

        serial_port_->set_option(serial_port_base::parity(serial_port_base::parity::none), ec);
        if (ec) {
            Logger::logWarning("[SerialPortDriver] Failed to set parity: " + ec.message());
        }

        serial_port_->set_option(serial_port_base::stop_bits(serial_port_base::stop_bits::one), ec);
        if (ec) {
            Logger::logWarning("[SerialPortDriver] Failed to set stop bits: " + ec.message());
        }

        // Le stampanti termiche usano spesso RTS/CTS; senza supporto si ripiega su none
        serial_port_->set_option(serial_port_base::flow_control(serial_port_base::flow_control::hardware), ec);
        if (ec) {
            serial_port_->set_option(serial_port_base::flow_control(serial_port_base::flow_control::none), ec);
            if (ec) {
                Logger::logWarning("[SerialPortDriver] Failed to set flow control: " + ec.message());
            }
        }
    }

    std::string SerialPortDriver::name() const {
        return "serial (" + portName_ + ")";
    }

    types::Result SerialPortDriver::write(const std::vector<uint8_t> &data) {
        std::lock_guard<std::mutex> lock(mutex_);

        boost::system::error_code ec;
        const std::size_t written = boost::asio::write(*serial_port_, boost::asio::buffer(data), ec);
        if (ec) {
            Logger::logError("[SerialPortDriver] Write error: " + ec.message());
            return types::Result::error("write failed: " + ec.message());
        }
        if (written != data.size()) {
            return types::Result::error("not all bytes written: " + std::to_string(written) + "/" +
                                        std::to_string(data.size()));
        }
        return types::Result::success("Written", written);
    }

    types::Result SerialPortDriver::read(std::vector<uint8_t> &buffer) {
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
                serial_port_->cancel();
            }
        });

        serial_port_->async_read_some(boost::asio::buffer(buffer),
                                      [&](const boost::system::error_code &ec, std::size_t n) {
                                          readError = ec;
                                          received = n;
                                          timer.cancel();
                                      });

        io_context_.restart();
        io_context_.run();

        if (timeout) {
            Logger::logWarning("[SerialPortDriver] Read timeout after " + std::to_string(readTimeoutMs_) + "ms");
            return types::Result::timeout("no data from " + portName_);
        }
        if (readError) {
            Logger::logError("[SerialPortDriver] Read error: " + readError.message());
            return types::Result::error("read failed: " + readError.message());
        }
        return types::Result::success("Read", received);
    }

    types::Result SerialPortDriver::flush() {
        std::lock_guard<std::mutex> lock(mutex_);
#ifndef _WIN32
        if (tcdrain(serial_port_->native_handle()) != 0) {
            return types::Result::error("tcdrain failed on " + portName_);
        }
#endif
        return types::Result::success("Flushed");
    }

} // namespace escpos::io
