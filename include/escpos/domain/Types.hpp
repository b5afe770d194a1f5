#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace escpos::domain {

    /**
     * @brief Tabella caratteri selezionabile con ESC t n. Il valore è l'ordinale sul filo.
     */
    enum class PageCode : uint8_t {
        PC437 = 0,
        Katakana = 1,
        PC850 = 2,
        PC860 = 3,
        PC863 = 4,
        PC865 = 5,
        Hiragana = 6,
        PC851 = 11,
        PC853 = 12,
        PC857 = 13,
        PC737 = 14,
        ISO8859_7 = 15,
        WPC1252 = 16,
        PC866 = 17,
        PC852 = 18,
        PC858 = 19,
        PC720 = 32,
        WPC775 = 33,
        PC855 = 34,
        PC861 = 35,
        PC862 = 36,
        PC864 = 37,
        PC869 = 38,
        ISO8859_2 = 39,
        ISO8859_15 = 40,
        PC1098 = 41,
        PC1118 = 42,
        PC1119 = 43,
        PC1125 = 44,
        WPC1250 = 45,
        WPC1251 = 46,
        WPC1253 = 47,
        WPC1254 = 48,
        WPC1255 = 49,
        WPC1256 = 50,
        WPC1257 = 51,
        WPC1258 = 52,
        KZ1048 = 53
    };

    /**
     * @brief Set di caratteri internazionale selezionabile con ESC R n.
     */
    enum class CharacterSet : uint8_t {
        USA = 0,
        France = 1,
        Germany = 2,
        UK = 3,
        Denmark1 = 4,
        Sweden = 5,
        Italy = 6,
        Spain1 = 7,
        Japan = 8,
        Norway = 9,
        Denmark2 = 10,
        Spain2 = 11,
        LatinAmerica = 12,
        Korea = 13,
        SloveniaCroatia = 14,
        China = 15,
        Vietnam = 16,
        Arabia = 17,
        IndiaDevanagari = 66,
        IndiaBengali = 67,
        IndiaTamil = 68,
        IndiaTelugu = 69,
        IndiaAssamese = 70,
        IndiaOriya = 71,
        IndiaKannada = 72,
        IndiaMalayalam = 73,
        IndiaGujarati = 74,
        IndiaPunjabi = 75,
        IndiaMarathi = 82
    };

    enum class Font : uint8_t {
        A = 0,
        B = 1,
        C = 2
    };

    enum class JustifyMode : uint8_t {
        Left = 0,
        Center = 1,
        Right = 2
    };

    enum class UnderlineMode : uint8_t {
        None = 0,
        Single = 1,
        Double = 2
    };

    enum class CashDrawer : uint8_t {
        Pin2 = 0,
        Pin5 = 1
    };

    struct TextSize {
        uint8_t width = 1;
        uint8_t height = 1;

        bool operator==(const TextSize &other) const {
            return width == other.width && height == other.height;
        }

        bool operator!=(const TextSize &other) const {
            return !(*this == other);
        }
    };

    std::string toString(PageCode code);

    std::string toString(CharacterSet set);

    std::string toString(Font font);

    std::string toString(JustifyMode mode);

    std::string toString(UnderlineMode mode);

    std::optional<PageCode> pageCodeFromString(const std::string &name);

} // namespace escpos::domain
