#include "escpos/command/ui/UiCommands.hpp"
#include "escpos/Protocol.hpp"

#include <algorithm>

namespace escpos::command::ui {

    using namespace escpos::domain;

    UiCommands::UiCommands(Protocol *protocol)
            : CommandCategoryInterface(protocol) {}

    std::vector<Command> UiCommands::drawLine(const domain::ui::Line &line,
                                              const printer::PrinterOptions &options,
                                              const printer::PrinterStyleState &style) const {
        const auto text = protocol_->text();
        std::vector<Command> commands;

        if (line.font) {
            commands.push_back(text->font(*line.font));
        }
        if (line.size) {
            commands.push_back(text->textSize(line.size->width, line.size->height));
        }
        if (line.justify) {
            commands.push_back(text->justify(*line.justify));
        }

        const TextSize size = line.size.value_or(style.textSize);
        const JustifyMode justify = line.justify.value_or(style.justify);

        const std::size_t maxWidth = options.charactersPerLine() / std::max<uint8_t>(size.width, 1);
        const std::size_t available = maxWidth > line.offset ? maxWidth - line.offset : 0;
        const std::size_t lineWidth = std::min<std::size_t>(line.width.value_or(maxWidth), available);

        const std::string pattern = line.style.pattern();
        std::string body;
        for (std::size_t i = 0; i < lineWidth; ++i) {
            body += pattern;
        }

        const std::string padding(line.offset, ' ');
        std::string content = justify == JustifyMode::Left ? padding + body : body + padding;
        content = truncateUtf8(content, maxWidth);

        if (!content.empty()) {
            commands.push_back(text->text(content, options.pageCode()));
            commands.push_back(protocol_->hardware()->feed(1));
        }

        // Ripristino solo dei campi toccati
        if (line.font) {
            commands.push_back(text->font(style.font));
        }
        if (line.size) {
            commands.push_back(text->textSize(style.textSize.width, style.textSize.height));
        }
        if (line.justify) {
            commands.push_back(text->justify(style.justify));
        }

        return commands;
    }

    std::string UiCommands::truncateUtf8(const std::string &value, std::size_t maxBytes) {
        if (value.size() <= maxBytes) {
            return value;
        }

        std::size_t end = maxBytes;
        // Indietro finché il byte successivo non è una continuazione (10xxxxxx)
        while (end > 0 && (static_cast<uint8_t>(value[end]) & 0xC0) == 0x80) {
            --end;
        }
        return value.substr(0, end);
    }

} // namespace escpos::command::ui
