#include "escpos/command/code2d/Pdf417Commands.hpp"
#include "escpos/CommandBuilder.hpp"
#include "escpos/Constants.hpp"

namespace escpos::command::code2d {

    using namespace escpos::constants;
    using namespace escpos::domain::code2d;

    Pdf417Commands::Pdf417Commands(Protocol *protocol)
            : CommandCategoryInterface(protocol) {}

    Command Pdf417Commands::columns(uint8_t columns) const {
        Pdf417Option::validateColumns(columns);
        return CommandBuilder::frame(CN_PDF417, 0x41, {columns});
    }

    Command Pdf417Commands::rows(uint8_t rows) const {
        Pdf417Option::validateRows(rows);
        return CommandBuilder::frame(CN_PDF417, 0x42, {rows});
    }

    Command Pdf417Commands::width(uint8_t width) const {
        Pdf417Option::validateWidth(width);
        return CommandBuilder::frame(CN_PDF417, 0x43, {width});
    }

    Command Pdf417Commands::rowHeight(uint8_t rowHeight) const {
        Pdf417Option::validateRowHeight(rowHeight);
        return CommandBuilder::frame(CN_PDF417, 0x44, {rowHeight});
    }

    Command Pdf417Commands::correctionLevel(const Pdf417CorrectionLevel &level) const {
        const auto [m, n] = level.bytes();
        return CommandBuilder::frame(CN_PDF417, 0x45, {m, n});
    }

    Command Pdf417Commands::type(Pdf417Type type) const {
        return CommandBuilder::frame(CN_PDF417, 0x46, {static_cast<uint8_t>(type)});
    }

    Command Pdf417Commands::data(const std::string &data) const {
        return CommandBuilder::dataFrame(CN_PDF417, {}, data);
    }

    Command Pdf417Commands::print() const {
        return CommandBuilder::frame(CN_PDF417, FN_PRINT, {STORE_PRINT_M});
    }

    std::vector<Command> Pdf417Commands::pdf417(const Pdf417 &code) const {
        const auto &option = code.option();
        return {
                columns(option.columns()),
                rows(option.rows()),
                width(option.width()),
                rowHeight(option.rowHeight()),
                correctionLevel(option.correctionLevel()),
                type(option.type()),
                data(code.data()),
                print(),
        };
    }

} // namespace escpos::command::code2d
