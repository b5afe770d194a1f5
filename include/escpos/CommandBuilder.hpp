#pragma once

#include "escpos/Command.hpp"
#include <array>
#include <cstdint>
#include <initializer_list>

namespace escpos {

/**
 * @brief Costruisce i frame dei comandi e codifica le lunghezze dei parametri.
 */
    class CommandBuilder {
    public:
        /**
         * @brief Divide length + padding in (pL, pH), little-endian.
         * @throws types::InputException se il totale supera 65535.
         */
        static std::array<uint8_t, 2> parameters2(uint64_t length, uint64_t padding = 0);

        /**
         * @brief Divide length + padding in (p1, p2, p3, p4), dal meno al più significativo.
         * @throws types::InputException se il totale supera 0xFFFFFFFF.
         */
        static std::array<uint8_t, 4> parameters4(uint64_t length, uint64_t padding = 0);

        static uint64_t recompose(const std::array<uint8_t, 2> &params);

        static uint64_t recompose(const std::array<uint8_t, 4> &params);

        /**
         * @brief Frame GS ( k: 1D 28 6B pL pH cn fn params...
         * @param cn Sottosistema del simbolo 2D.
         * @param fn Codice funzione.
         * @param params Byte che seguono fn; la lunghezza codificata è params.size() + 2.
         */
        static Command frame(uint8_t cn, uint8_t fn, const std::vector<uint8_t> &params);

        /**
         * @brief Frame dati GS ( k con il selettore m = 0x30 davanti al payload.
         */
        static Command dataFrame(uint8_t cn, const std::vector<uint8_t> &header, const std::string &data);

        /**
         * @brief Concatena prefisso e argomenti in un unico comando.
         */
        static Command build(std::initializer_list<uint8_t> prefix, std::initializer_list<uint8_t> args = {});
    };

} // namespace escpos
