#pragma once

#include "escpos/domain/Types.hpp"
#include <cstdint>
#include <memory>
#include <unordered_map>

namespace escpos::encoder {

    /// Scalare Unicode -> byte della tabella caratteri.
    using PageCodeTable = std::unordered_map<char32_t, uint8_t>;

    /**
     * @brief Registro delle tabelle caratteri, costruite una sola volta al primo accesso.
     *
     * Ogni tabella viene pubblicata come handle immutabile condiviso e non viene mai
     * modificata dopo la costruzione.
     */
    class PageCodeTables {
    public:
        static bool hasTable(domain::PageCode code);

        /**
         * @throws types::InputException se la tabella non è registrata.
         */
        static std::shared_ptr<const PageCodeTable> get(domain::PageCode code);
    };

} // namespace escpos::encoder
