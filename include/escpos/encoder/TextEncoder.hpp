#pragma once

#include "escpos/Command.hpp"
#include "escpos/domain/Types.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace escpos::encoder {

    /**
     * @brief Cosa fa l'encoder generico con un carattere che il charset di destinazione non può rappresentare.
     */
    enum class UnmappablePolicy {
        Replace,
        Strict
    };

    /**
     * @brief Converte testo UTF-8 nei byte della stampante.
     *
     * Con una page code, i caratteri presenti nella tabella costano un byte ciascuno e tutti
     * gli altri ricadono sulla codifica generica del charset. L'output non supera mai
     * il budget di byte opzionale.
     */
    class TextEncoder {
    public:
        explicit TextEncoder(std::string charset = "UTF-8",
                             UnmappablePolicy policy = UnmappablePolicy::Replace);

        const std::string &charset() const;

        UnmappablePolicy policy() const;

        /**
         * @throws types::InputException per una page code senza tabella, o per un carattere
         *         non mappabile con UnmappablePolicy::Strict.
         */
        Command encode(const std::string &text,
                       std::optional<domain::PageCode> pageCode = std::nullopt,
                       std::optional<std::size_t> maxLength = std::nullopt) const;

        /**
         * @brief Codifica l'intera stringa con il charset generico, senza page code.
         */
        std::string encodeGeneric(const std::string &text) const;

    private:
        std::string charset_;
        UnmappablePolicy policy_;

        bool isUtf8() const;

        std::string encodeScalar(char32_t scalar) const;

        std::string replacement(const std::string &reason) const;
    };

} // namespace escpos::encoder
