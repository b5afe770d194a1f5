#pragma once

#include <cstdint>
#include <string>

namespace escpos::domain::code2d {

    enum class MaxiCodeMode : uint8_t {
        Mode2 = 0x32,
        Mode3 = 0x33,
        Mode4 = 0x34,
        Mode5 = 0x35,
        Mode6 = 0x36
    };

    class MaxiCode {
    public:
        MaxiCode(std::string data, MaxiCodeMode mode = MaxiCodeMode::Mode2);

        const std::string &data() const;

        MaxiCodeMode mode() const;

    private:
        std::string data_;
        MaxiCodeMode mode_;
    };

} // namespace escpos::domain::code2d
