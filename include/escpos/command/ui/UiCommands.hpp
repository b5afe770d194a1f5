#pragma once

#include "escpos/command/CommandCategoryInterface.hpp"
#include "escpos/domain/ui/Line.hpp"
#include "escpos/printer/PrinterOptions.hpp"
#include "escpos/printer/PrinterStyleState.hpp"
#include <string>
#include <vector>

namespace escpos::command::ui {

/**
 * @brief Componenti grafici composti da comandi di testo.
 */
    class UiCommands : public CommandCategoryInterface {
    public:
        explicit UiCommands(Protocol *protocol);

        /**
         * @brief Disegna una linea e ripristina lo stile corrente per i campi modificati.
         *
         * La larghezza massima è charactersPerLine / larghezza del testo; l'offset riduce la linea
         * e si aggiunge come spazi a sinistra (giustificato a sinistra) o a destra.
         */
        std::vector<Command> drawLine(const domain::ui::Line &line,
                                      const printer::PrinterOptions &options,
                                      const printer::PrinterStyleState &style) const;

        /**
         * @brief Tronca a maxBytes senza spezzare una sequenza UTF-8.
         */
        static std::string truncateUtf8(const std::string &value, std::size_t maxBytes);
    };

} // namespace escpos::command::ui
