#include "escpos/encoder/TextEncoder.hpp"
#include "escpos/encoder/PageCodeTables.hpp"
#include "escpos/types/Error.hpp"

#include <boost/locale/encoding.hpp>
#include <boost/locale/utf.hpp>

#include <cctype>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace escpos::encoder {

    namespace utf = boost::locale::utf;

    TextEncoder::TextEncoder(std::string charset, UnmappablePolicy policy)
            : charset_(std::move(charset)),
              policy_(policy) {}

    const std::string &TextEncoder::charset() const {
        return charset_;
    }

    UnmappablePolicy TextEncoder::policy() const {
        return policy_;
    }

    Command TextEncoder::encode(const std::string &text, std::optional<domain::PageCode> pageCode,
                                std::optional<std::size_t> maxLength) const {
        if (!pageCode) {
            std::string bytes = encodeGeneric(text);
            if (maxLength && bytes.size() > *maxLength) {
                bytes.resize(*maxLength);
            }
            return Command(bytes.begin(), bytes.end());
        }

        const auto table = PageCodeTables::get(*pageCode);
        Command out;

        auto it = text.begin();
        while (it != text.end()) {
            const utf::code_point scalar = utf::utf_traits<char>::decode(it, text.end());

            std::string bytes;
            if (scalar == utf::illegal || scalar == utf::incomplete) {
                bytes = replacement("invalid UTF-8 sequence");
            } else {
                auto found = table->find(static_cast<char32_t>(scalar));
                if (found != table->end()) {
                    bytes.push_back(static_cast<char>(found->second));
                } else {
                    bytes = encodeScalar(static_cast<char32_t>(scalar));
                }
            }

            if (maxLength && out.size() + bytes.size() > *maxLength) {
                break;
            }
            out.insert(out.end(), bytes.begin(), bytes.end());
        }

        return out;
    }

    std::string TextEncoder::encodeGeneric(const std::string &text) const {
        std::string out;
        out.reserve(text.size());

        auto it = text.begin();
        while (it != text.end()) {
            const utf::code_point scalar = utf::utf_traits<char>::decode(it, text.end());
            if (scalar == utf::illegal || scalar == utf::incomplete) {
                out += replacement("invalid UTF-8 sequence");
            } else {
                out += encodeScalar(static_cast<char32_t>(scalar));
            }
        }
        return out;
    }

    bool TextEncoder::isUtf8() const {
        std::string normalized;
        for (const char c: charset_) {
            if (c == '-' || c == '_') continue;
            normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        return normalized == "utf8";
    }

    std::string TextEncoder::encodeScalar(char32_t scalar) const {
        std::string utf8;
        utf::utf_traits<char>::encode(static_cast<utf::code_point>(scalar), std::back_inserter(utf8));
        if (isUtf8()) {
            return utf8;
        }

        try {
            return boost::locale::conv::from_utf(utf8, charset_, boost::locale::conv::stop);
        } catch (const boost::locale::conv::invalid_charset_error &e) {
            throw types::InputException("unsupported charset " + charset_ + ": " + e.what());
        } catch (const boost::locale::conv::conversion_error &) {
            std::ostringstream reason;
            reason << "character U+" << std::uppercase << std::hex << std::setw(4) << std::setfill('0')
                   << static_cast<uint32_t>(scalar) << " cannot be encoded in " << charset_;
            return replacement(reason.str());
        }
    }

    std::string TextEncoder::replacement(const std::string &reason) const {
        if (policy_ == UnmappablePolicy::Strict) {
            throw types::InputException(reason);
        }
        return "?";
    }

} // namespace escpos::encoder
