#pragma once

#include <cstddef>
#include <cstdint>

namespace escpos::constants {

    constexpr uint8_t NUL = 0x00;
    constexpr uint8_t LF = 0x0A;
    constexpr uint8_t DLE = 0x10;
    constexpr uint8_t CAN = 0x18;
    constexpr uint8_t ESC = 0x1B;
    constexpr uint8_t GS = 0x1D;

    // GS ( k subsystems
    constexpr uint8_t CN_PDF417 = 0x30;
    constexpr uint8_t CN_QRCODE = 0x31;
    constexpr uint8_t CN_MAXICODE = 0x32;
    constexpr uint8_t CN_GS1_DATABAR = 0x33;
    constexpr uint8_t CN_DATAMATRIX = 0x35;
    constexpr uint8_t CN_AZTEC = 0x36;

    // Function code condivisi dai sottosistemi 2D
    constexpr uint8_t FN_STORE_DATA = 0x50;
    constexpr uint8_t FN_PRINT = 0x51;
    constexpr uint8_t STORE_PRINT_M = 0x30;

    constexpr std::size_t QRCODE_MAX_DATA_LENGTH = 7089;
    constexpr std::size_t GS1_EXPANDED_MAX_LENGTH = 255;

    constexpr uint8_t DEFAULT_CHARACTERS_PER_LINE = 42;

} // namespace escpos::constants
