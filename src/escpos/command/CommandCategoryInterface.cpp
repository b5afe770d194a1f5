#include "escpos/command/CommandCategoryInterface.hpp"
#include "escpos/types/Error.hpp"

namespace escpos::command {

    CommandCategoryInterface::CommandCategoryInterface(Protocol *protocol)
            : protocol_(protocol) {}

    void CommandCategoryInterface::checkRange(const std::string &field, int value, int min, int max) {
        if (value < min || value > max) {
            throw types::InputException(field + " must be in " + std::to_string(min) + ".." +
                                        std::to_string(max) + ", got " + std::to_string(value));
        }
    }

} // namespace escpos::command
