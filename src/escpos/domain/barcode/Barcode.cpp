#include "escpos/domain/barcode/Barcode.hpp"
#include "escpos/types/Error.hpp"

#include <algorithm>
#include <initializer_list>

namespace escpos::domain::barcode {

    namespace {
        const std::string CODE39_CHARS = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ $%*+-./";
        const std::string CODABAR_CHARS = "0123456789ABCDabcd$+-./:";

        bool allDigits(const std::string &data) {
            return std::all_of(data.begin(), data.end(), [](char c) { return c >= '0' && c <= '9'; });
        }

        bool allIn(const std::string &data, const std::string &alphabet) {
            return std::all_of(data.begin(), data.end(), [&alphabet](char c) {
                return alphabet.find(c) != std::string::npos;
            });
        }

        bool lengthIn(const std::string &data, std::initializer_list<size_t> lengths) {
            return std::find(lengths.begin(), lengths.end(), data.size()) != lengths.end();
        }
    }

    uint8_t widthValue(BarcodeWidth width) {
        switch (width) {
            case BarcodeWidth::XS:
                return 1;
            case BarcodeWidth::S:
                return 2;
            case BarcodeWidth::M:
                return 3;
            case BarcodeWidth::L:
                return 4;
            case BarcodeWidth::XL:
                return 5;
        }
        return 3;
    }

    uint8_t heightValue(BarcodeHeight height) {
        switch (height) {
            case BarcodeHeight::XS:
                return 51;
            case BarcodeHeight::S:
                return 102;
            case BarcodeHeight::M:
                return 153;
            case BarcodeHeight::L:
                return 204;
            case BarcodeHeight::XL:
                return 255;
        }
        return 102;
    }

    std::string toString(BarcodeSystem system) {
        switch (system) {
            case BarcodeSystem::UPCA:
                return "UPC-A";
            case BarcodeSystem::UPCE:
                return "UPC-E";
            case BarcodeSystem::EAN13:
                return "EAN13";
            case BarcodeSystem::EAN8:
                return "EAN8";
            case BarcodeSystem::CODE39:
                return "CODE39";
            case BarcodeSystem::ITF:
                return "ITF";
            case BarcodeSystem::CODABAR:
                return "CODABAR";
        }
        return "Unknown";
    }

    Barcode::Barcode(BarcodeSystem system, std::string data, BarcodeOption option)
            : system_(system),
              data_(std::move(data)),
              option_(option) {
        validate(system_, data_);
    }

    BarcodeSystem Barcode::system() const {
        return system_;
    }

    const std::string &Barcode::data() const {
        return data_;
    }

    const BarcodeOption &Barcode::option() const {
        return option_;
    }

    bool Barcode::isValid(BarcodeSystem system, const std::string &data) {
        switch (system) {
            case BarcodeSystem::UPCA:
                return allDigits(data) && lengthIn(data, {11, 12});
            case BarcodeSystem::UPCE:
                // 6 cifre compresse, oppure qualsiasi dato con number system 0
                return (allDigits(data) && lengthIn(data, {6, 7, 8, 11, 12}) && data.size() == 6) ||
                       (!data.empty() && data.front() == '0');
            case BarcodeSystem::EAN8:
                return allDigits(data) && lengthIn(data, {7, 8});
            case BarcodeSystem::EAN13:
                return allDigits(data) && lengthIn(data, {12, 13});
            case BarcodeSystem::ITF:
                return data.size() >= 2 && allDigits(data);
            case BarcodeSystem::CODE39:
                return !data.empty() && allIn(data, CODE39_CHARS);
            case BarcodeSystem::CODABAR:
                return data.size() >= 2 && allIn(data, CODABAR_CHARS);
        }
        return false;
    }

    void Barcode::validate(BarcodeSystem system, const std::string &data) {
        if (!isValid(system, data)) {
            throw types::InputException("invalid " + toString(system) + " data: " + data);
        }
    }

} // namespace escpos::domain::barcode
