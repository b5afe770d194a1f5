#include "escpos/domain/Types.hpp"

#include <array>
#include <utility>

namespace escpos::domain {

    namespace {
        const std::array<std::pair<PageCode, const char *>, 38> PAGE_CODE_NAMES = {{
                {PageCode::PC437, "PC437"}, {PageCode::Katakana, "Katakana"},
                {PageCode::PC850, "PC850"}, {PageCode::PC860, "PC860"},
                {PageCode::PC863, "PC863"}, {PageCode::PC865, "PC865"},
                {PageCode::Hiragana, "Hiragana"}, {PageCode::PC851, "PC851"},
                {PageCode::PC853, "PC853"}, {PageCode::PC857, "PC857"},
                {PageCode::PC737, "PC737"}, {PageCode::ISO8859_7, "ISO8859_7"},
                {PageCode::WPC1252, "WPC1252"}, {PageCode::PC866, "PC866"},
                {PageCode::PC852, "PC852"}, {PageCode::PC858, "PC858"},
                {PageCode::PC720, "PC720"}, {PageCode::WPC775, "WPC775"},
                {PageCode::PC855, "PC855"}, {PageCode::PC861, "PC861"},
                {PageCode::PC862, "PC862"}, {PageCode::PC864, "PC864"},
                {PageCode::PC869, "PC869"}, {PageCode::ISO8859_2, "ISO8859_2"},
                {PageCode::ISO8859_15, "ISO8859_15"}, {PageCode::PC1098, "PC1098"},
                {PageCode::PC1118, "PC1118"}, {PageCode::PC1119, "PC1119"},
                {PageCode::PC1125, "PC1125"}, {PageCode::WPC1250, "WPC1250"},
                {PageCode::WPC1251, "WPC1251"}, {PageCode::WPC1253, "WPC1253"},
                {PageCode::WPC1254, "WPC1254"}, {PageCode::WPC1255, "WPC1255"},
                {PageCode::WPC1256, "WPC1256"}, {PageCode::WPC1257, "WPC1257"},
                {PageCode::WPC1258, "WPC1258"}, {PageCode::KZ1048, "KZ1048"},
        }};
    }

    std::string toString(PageCode code) {
        for (const auto &[value, name]: PAGE_CODE_NAMES) {
            if (value == code) return name;
        }
        return "Unknown";
    }

    std::optional<PageCode> pageCodeFromString(const std::string &name) {
        for (const auto &[value, label]: PAGE_CODE_NAMES) {
            if (name == label) return value;
        }
        return std::nullopt;
    }

    std::string toString(CharacterSet set) {
        switch (set) {
            case CharacterSet::USA:
                return "USA";
            case CharacterSet::France:
                return "France";
            case CharacterSet::Germany:
                return "Germany";
            case CharacterSet::UK:
                return "UK";
            case CharacterSet::Denmark1:
                return "Denmark I";
            case CharacterSet::Sweden:
                return "Sweden";
            case CharacterSet::Italy:
                return "Italy";
            case CharacterSet::Spain1:
                return "Spain I";
            case CharacterSet::Japan:
                return "Japan";
            case CharacterSet::Norway:
                return "Norway";
            case CharacterSet::Denmark2:
                return "Denmark II";
            case CharacterSet::Spain2:
                return "Spain II";
            case CharacterSet::LatinAmerica:
                return "Latin America";
            case CharacterSet::Korea:
                return "Korea";
            case CharacterSet::SloveniaCroatia:
                return "Slovenia/Croatia";
            case CharacterSet::China:
                return "China";
            case CharacterSet::Vietnam:
                return "Vietnam";
            case CharacterSet::Arabia:
                return "Arabia";
            case CharacterSet::IndiaDevanagari:
                return "India (Devanagari)";
            case CharacterSet::IndiaBengali:
                return "India (Bengali)";
            case CharacterSet::IndiaTamil:
                return "India (Tamil)";
            case CharacterSet::IndiaTelugu:
                return "India (Telugu)";
            case CharacterSet::IndiaAssamese:
                return "India (Assamese)";
            case CharacterSet::IndiaOriya:
                return "India (Oriya)";
            case CharacterSet::IndiaKannada:
                return "India (Kannada)";
            case CharacterSet::IndiaMalayalam:
                return "India (Malayalam)";
            case CharacterSet::IndiaGujarati:
                return "India (Gujarati)";
            case CharacterSet::IndiaPunjabi:
                return "India (Punjabi)";
            case CharacterSet::IndiaMarathi:
                return "India (Marathi)";
            default:
                return "Unknown";
        }
    }

    std::string toString(Font font) {
        switch (font) {
            case Font::A:
                return "font A";
            case Font::B:
                return "font B";
            case Font::C:
                return "font C";
            default:
                return "Unknown";
        }
    }

    std::string toString(JustifyMode mode) {
        switch (mode) {
            case JustifyMode::Left:
                return "left";
            case JustifyMode::Center:
                return "center";
            case JustifyMode::Right:
                return "right";
            default:
                return "Unknown";
        }
    }

    std::string toString(UnderlineMode mode) {
        switch (mode) {
            case UnderlineMode::None:
                return "none";
            case UnderlineMode::Single:
                return "single";
            case UnderlineMode::Double:
                return "double";
            default:
                return "Unknown";
        }
    }

} // namespace escpos::domain
