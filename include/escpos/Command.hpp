#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace escpos {

    /// Frammento di comando atomico inviato alla stampante.
    using Command = std::vector<uint8_t>;

    enum class DebugMode {
        Hex,
        Dec
    };

    /**
     * @brief Etichetta più lista ordinata di comandi, accodata dalla Printer.
     *
     * La modalità di debug influenza solo la rappresentazione testuale,
     * mai i byte prodotti da flatten().
     */
    class Instruction {
    public:
        Instruction(std::string name, std::vector<Command> commands,
                    std::optional<DebugMode> debugMode = std::nullopt);

        const std::string &name() const;

        const std::vector<Command> &commands() const;

        std::optional<DebugMode> debugMode() const;

        /**
         * @brief Concatena i comandi nell'ordine di inserimento.
         */
        Command flatten() const;

        std::string toString() const;

    private:
        std::string name_;
        std::vector<Command> commands_;
        std::optional<DebugMode> debugMode_;
    };

    std::string debugModeToString(DebugMode mode);

    std::optional<DebugMode> debugModeFromString(const std::string &name);

} // namespace escpos
