#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace escpos::domain::code2d {

    /**
     * @brief Modalità Aztec e numero di layer.
     *
     * Full-range: layer in {0} ∪ {4..32}. Compact: layer in 0..4. 0 = automatico.
     */
    class AztecMode {
    public:
        AztecMode();

        static AztecMode fullRange(uint8_t layers);

        static AztecMode compact(uint8_t layers);

        bool isCompact() const;

        uint8_t layers() const;

        /// Byte (n1, n2) del comando.
        std::pair<uint8_t, uint8_t> bytes() const;

    private:
        AztecMode(bool compact, uint8_t layers);

        bool compact_;
        uint8_t layers_;
    };

    class AztecOption {
    public:
        AztecOption();

        /**
         * @throws types::InputException se size non è in 2..16 o correctionLevel non è in 5..95.
         */
        AztecOption(AztecMode mode, uint8_t size, uint8_t correctionLevel);

        const AztecMode &mode() const;

        uint8_t size() const;

        uint8_t correctionLevel() const;

    private:
        AztecMode mode_;
        uint8_t size_;
        uint8_t correctionLevel_;
    };

    class Aztec {
    public:
        Aztec(std::string data, AztecOption option = AztecOption());

        const std::string &data() const;

        const AztecOption &option() const;

    private:
        std::string data_;
        AztecOption option_;
    };

} // namespace escpos::domain::code2d
