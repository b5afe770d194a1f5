#include "escpos/domain/code2d/Aztec.hpp"
#include "escpos/types/Error.hpp"

namespace escpos::domain::code2d {

    AztecMode::AztecMode()
            : compact_(false), layers_(0) {}

    AztecMode::AztecMode(bool compact, uint8_t layers)
            : compact_(compact), layers_(layers) {}

    AztecMode AztecMode::fullRange(uint8_t layers) {
        if (layers != 0 && (layers < 4 || layers > 32)) {
            throw types::InputException("Aztec full-range layers must be 0 or in 4..32, got " +
                                        std::to_string(layers));
        }
        return {false, layers};
    }

    AztecMode AztecMode::compact(uint8_t layers) {
        if (layers > 4) {
            throw types::InputException("Aztec compact layers must be in 0..4, got " + std::to_string(layers));
        }
        return {true, layers};
    }

    bool AztecMode::isCompact() const {
        return compact_;
    }

    uint8_t AztecMode::layers() const {
        return layers_;
    }

    std::pair<uint8_t, uint8_t> AztecMode::bytes() const {
        return {static_cast<uint8_t>(compact_ ? 1 : 0), layers_};
    }

    AztecOption::AztecOption()
            : mode_(), size_(3), correctionLevel_(23) {}

    AztecOption::AztecOption(AztecMode mode, uint8_t size, uint8_t correctionLevel)
            : mode_(mode), size_(size), correctionLevel_(correctionLevel) {
        if (size_ < 2 || size_ > 16) {
            throw types::InputException("Aztec module size must be in 2..16, got " + std::to_string(size_));
        }
        if (correctionLevel_ < 5 || correctionLevel_ > 95) {
            throw types::InputException("Aztec correction level must be in 5..95, got " +
                                        std::to_string(correctionLevel_));
        }
    }

    const AztecMode &AztecOption::mode() const {
        return mode_;
    }

    uint8_t AztecOption::size() const {
        return size_;
    }

    uint8_t AztecOption::correctionLevel() const {
        return correctionLevel_;
    }

    Aztec::Aztec(std::string data, AztecOption option)
            : data_(std::move(data)),
              option_(option) {}

    const std::string &Aztec::data() const {
        return data_;
    }

    const AztecOption &Aztec::option() const {
        return option_;
    }

} // namespace escpos::domain::code2d
