#include "escpos/io/ConsoleDriver.hpp"

namespace escpos::io {

    ConsoleDriver::ConsoleDriver(std::ostream &out)
            : out_(out) {}

    std::string ConsoleDriver::name() const {
        return "console";
    }

    types::Result ConsoleDriver::write(const std::vector<uint8_t> &data) {
        std::lock_guard<std::mutex> lock(mutex_);
        out_.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!out_) {
            return types::Result::error("console stream write failed");
        }
        return types::Result::success("Written", data.size());
    }

    types::Result ConsoleDriver::read(std::vector<uint8_t> &) {
        return types::Result::error("console driver cannot read");
    }

    types::Result ConsoleDriver::flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        out_.flush();
        if (!out_) {
            return types::Result::error("console stream flush failed");
        }
        return types::Result::success("Flushed");
    }

} // namespace escpos::io
