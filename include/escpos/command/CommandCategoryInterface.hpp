#pragma once

#include "escpos/Command.hpp"
#include <string>

namespace escpos {

    class Protocol; // Forward declaration

    namespace command {

/**
 * @brief Interfaccia base per ogni categoria di comandi.
 */
        class CommandCategoryInterface {
        public:
            virtual ~CommandCategoryInterface() = default;

        protected:
            explicit CommandCategoryInterface(Protocol *protocol);

            /**
             * @brief Verifica che value sia in [min, max].
             * @throws types::InputException con il nome del campo e il range ammesso.
             */
            static void checkRange(const std::string &field, int value, int min, int max);

            Protocol *protocol_;
        };

    } // namespace command
} // namespace escpos
