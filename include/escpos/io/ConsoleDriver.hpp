#pragma once

#include "escpos/io/Driver.hpp"
#include <iostream>
#include <mutex>

namespace escpos::io {

/**
 * @brief Driver di debug: scrive i byte grezzi su uno stream (stdout di default).
 */
    class ConsoleDriver : public Driver {
    public:
        explicit ConsoleDriver(std::ostream &out = std::cout);

        std::string name() const override;

        types::Result write(const std::vector<uint8_t> &data) override;

        /// Nessun canale di ritorno: sempre Error.
        types::Result read(std::vector<uint8_t> &buffer) override;

        types::Result flush() override;

    private:
        std::ostream &out_;
        std::mutex mutex_;
    };

} // namespace escpos::io
