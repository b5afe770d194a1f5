#pragma once

#include <stdexcept>
#include <string>

namespace escpos::types {

    class PrinterException : public std::runtime_error {
    public:
        explicit PrinterException(const std::string &msg)
                : std::runtime_error(msg) {}
    };

    /**
     * @brief Parametro fuori range, payload non valido o testo non codificabile.
     */
    class InputException : public PrinterException {
    public:
        explicit InputException(const std::string &msg)
                : PrinterException("Input error: " + msg) {}
    };

    /**
     * @brief Errore di I/O riportato dal driver durante write, read o flush.
     */
    class TransportException : public PrinterException {
    public:
        explicit TransportException(const std::string &msg)
                : PrinterException("Transport error: " + msg) {}
    };

    class TimeoutException : public TransportException {
    public:
        TimeoutException() : TransportException("Timeout waiting for response") {}
    };

    /**
     * @brief Risposta di stato che non rispetta il template di bit atteso.
     */
    class ProtocolException : public PrinterException {
    public:
        explicit ProtocolException(const std::string &msg)
                : PrinterException("Protocol error: " + msg) {}
    };

} // namespace escpos::types
