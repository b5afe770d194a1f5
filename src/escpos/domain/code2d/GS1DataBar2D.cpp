#include "escpos/domain/code2d/GS1DataBar2D.hpp"
#include "escpos/Constants.hpp"
#include "escpos/types/Error.hpp"

#include <algorithm>

namespace escpos::domain::code2d {

    namespace {
        const std::string EXPANDED_STACKED_CHARS = "0123456789ABCD !\"%$'()*+,-./:;<=>?_{";
    }

    std::string toString(GS1DataBar2DType type) {
        switch (type) {
            case GS1DataBar2DType::Stacked:
                return "GS1 DataBar Stacked";
            case GS1DataBar2DType::StackedOmnidirectional:
                return "GS1 DataBar Stacked Omnidirectional";
            case GS1DataBar2DType::ExpandedStacked:
                return "GS1 DataBar Expanded Stacked";
        }
        return "Unknown";
    }

    GS1DataBar2D::GS1DataBar2D(std::string data, GS1DataBar2DOption option)
            : data_(std::move(data)),
              option_(option) {
        if (!isValid(option_.type, data_)) {
            throw types::InputException("invalid " + toString(option_.type) + " data: " + data_);
        }
    }

    const std::string &GS1DataBar2D::data() const {
        return data_;
    }

    const GS1DataBar2DOption &GS1DataBar2D::option() const {
        return option_;
    }

    bool GS1DataBar2D::isValid(GS1DataBar2DType type, const std::string &data) {
        switch (type) {
            case GS1DataBar2DType::Stacked:
            case GS1DataBar2DType::StackedOmnidirectional:
                return data.size() == 13 &&
                       std::all_of(data.begin(), data.end(), [](char c) { return c >= '0' && c <= '9'; });
            case GS1DataBar2DType::ExpandedStacked:
                // un payload vuoto è accettato
                return data.size() <= constants::GS1_EXPANDED_MAX_LENGTH &&
                       std::all_of(data.begin(), data.end(), [](char c) {
                           return EXPANDED_STACKED_CHARS.find(c) != std::string::npos;
                       });
        }
        return false;
    }

} // namespace escpos::domain::code2d
