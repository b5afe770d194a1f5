#include "escpos/io/FileDriver.hpp"
#include "escpos/types/Error.hpp"
#include "logger/Logger.hpp"

namespace escpos::io {

    FileDriver::FileDriver(const std::string &path)
            : path_(path) {
        file_.open(path_, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!file_.is_open()) {
            Logger::logError("[FileDriver] Failed to open " + path_);
            throw types::TransportException("cannot open file " + path_);
        }
        Logger::logInfo("[FileDriver] Opened " + path_);
    }

    FileDriver::~FileDriver() {
        if (file_.is_open()) {
            file_.close();
        }
    }

    std::string FileDriver::name() const {
        return "file (" + path_ + ")";
    }

    const std::string &FileDriver::path() const {
        return path_;
    }

    types::Result FileDriver::write(const std::vector<uint8_t> &data) {
        std::lock_guard<std::mutex> lock(mutex_);
        file_.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!file_) {
            Logger::logError("[FileDriver] Write error on " + path_);
            return types::Result::error("write failed on " + path_);
        }
        return types::Result::success("Written", data.size());
    }

    types::Result FileDriver::read(std::vector<uint8_t> &) {
        return types::Result::error("file driver cannot read");
    }

    types::Result FileDriver::flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        file_.flush();
        if (!file_) {
            return types::Result::error("flush failed on " + path_);
        }
        return types::Result::success("Flushed");
    }

} // namespace escpos::io
