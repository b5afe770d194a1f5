#include "escpos/domain/code2d/MaxiCode.hpp"

namespace escpos::domain::code2d {

    MaxiCode::MaxiCode(std::string data, MaxiCodeMode mode)
            : data_(std::move(data)),
              mode_(mode) {}

    const std::string &MaxiCode::data() const {
        return data_;
    }

    MaxiCodeMode MaxiCode::mode() const {
        return mode_;
    }

} // namespace escpos::domain::code2d
