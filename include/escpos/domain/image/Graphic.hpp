#pragma once

#include <cstdint>
#include <string>

namespace escpos::domain::image {

    /// Densità grafica per GS ( L, in dpi.
    enum class GraphicDensity : uint8_t {
        Low = 0x32,
        High = 0x33
    };

    inline std::string toString(GraphicDensity density) {
        return density == GraphicDensity::Low ? "180dpi" : "360dpi";
    }

} // namespace escpos::domain::image
