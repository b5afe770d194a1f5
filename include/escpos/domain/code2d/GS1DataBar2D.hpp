#pragma once

#include <cstdint>
#include <string>

namespace escpos::domain::code2d {

    enum class GS1DataBar2DType : uint8_t {
        Stacked = 0x48,
        StackedOmnidirectional = 0x49,
        ExpandedStacked = 0x4C
    };

    /// Preset di larghezza del modulo. I valori sul filo non sono monotoni: S = 2, M = 1, L = 4.
    enum class GS1DataBar2DWidth : uint8_t {
        S = 2,
        M = 1,
        L = 4
    };

    struct GS1DataBar2DOption {
        GS1DataBar2DWidth width = GS1DataBar2DWidth::M;
        GS1DataBar2DType type = GS1DataBar2DType::Stacked;
    };

    std::string toString(GS1DataBar2DType type);

    class GS1DataBar2D {
    public:
        /**
         * @throws types::InputException se il payload non corrisponde al tipo di simbolo.
         */
        GS1DataBar2D(std::string data, GS1DataBar2DOption option = GS1DataBar2DOption());

        const std::string &data() const;

        const GS1DataBar2DOption &option() const;

        static bool isValid(GS1DataBar2DType type, const std::string &data);

    private:
        std::string data_;
        GS1DataBar2DOption option_;
    };

} // namespace escpos::domain::code2d
