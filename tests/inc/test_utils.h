#pragma once

#include "escpos/Command.hpp"
#include "escpos/io/Driver.hpp"

#include <cstdint>
#include <deque>
#include <initializer_list>
#include <string>
#include <vector>

namespace escpos::test {

    /**
     * @brief Driver in memoria: registra ogni write e restituisce le risposte preparate.
     */
    class MemoryDriver : public io::Driver {
    public:
        std::string name() const override {
            return "memory";
        }

        types::Result write(const std::vector<uint8_t> &data) override {
            writes.push_back(data);
            return types::Result::success("Written", data.size());
        }

        types::Result read(std::vector<uint8_t> &buffer) override {
            std::size_t n = 0;
            while (n < buffer.size() && !responses.empty()) {
                buffer[n++] = responses.front();
                responses.pop_front();
            }
            if (n == 0) {
                return types::Result::timeout("no response queued");
            }
            return types::Result::success("Read", n);
        }

        types::Result flush() override {
            ++flushes;
            return types::Result::success("Flushed");
        }

        Command allBytes() const {
            Command bytes;
            for (const auto &w: writes) {
                bytes.insert(bytes.end(), w.begin(), w.end());
            }
            return bytes;
        }

        std::vector<Command> writes;
        std::deque<uint8_t> responses;
        int flushes = 0;
    };

    /**
     * @brief Driver che fallisce in write o in flush.
     */
    class FailingDriver : public io::Driver {
    public:
        explicit FailingDriver(bool failOnFlush = false) : failOnFlush_(failOnFlush) {}

        std::string name() const override {
            return "failing";
        }

        types::Result write(const std::vector<uint8_t> &) override {
            ++writes;
            if (failOnFlush_) {
                return types::Result::success("Written");
            }
            return types::Result::error("device unplugged");
        }

        types::Result read(std::vector<uint8_t> &) override {
            return types::Result::error("device unplugged");
        }

        types::Result flush() override {
            ++flushes;
            return failOnFlush_ ? types::Result::error("flush failed") : types::Result::success("Flushed");
        }

        int writes = 0;
        int flushes = 0;

    private:
        bool failOnFlush_;
    };

    inline Command bytes(std::initializer_list<uint8_t> values) {
        return Command(values);
    }

    inline Command concat(const std::vector<Command> &commands) {
        Command out;
        for (const auto &cmd: commands) {
            out.insert(out.end(), cmd.begin(), cmd.end());
        }
        return out;
    }

} // namespace escpos::test
