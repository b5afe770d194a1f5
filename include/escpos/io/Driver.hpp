#pragma once

#include "escpos/types/Result.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace escpos::io {

/**
 * @brief Trasporto verso la stampante. Ogni implementazione serializza il proprio I/O.
 */
    class Driver {
    public:
        virtual ~Driver() = default;

        virtual std::string name() const = 0;

        /**
         * @brief Scrive tutti i byte.
         * @return Success con il numero di byte scritti, altrimenti Error.
         */
        virtual types::Result write(const std::vector<uint8_t> &data) = 0;

        /**
         * @brief Legge fino a buffer.size() byte.
         * @return Success con i byte letti in Result::bytes, Timeout se non arriva nulla in tempo.
         */
        virtual types::Result read(std::vector<uint8_t> &buffer) = 0;

        virtual types::Result flush() = 0;
    };

} // namespace escpos::io
