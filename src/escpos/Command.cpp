#include "escpos/Command.hpp"

#include <iomanip>
#include <sstream>

namespace escpos {

    Instruction::Instruction(std::string name, std::vector<Command> commands, std::optional<DebugMode> debugMode)
            : name_(std::move(name)),
              commands_(std::move(commands)),
              debugMode_(debugMode) {}

    const std::string &Instruction::name() const {
        return name_;
    }

    const std::vector<Command> &Instruction::commands() const {
        return commands_;
    }

    std::optional<DebugMode> Instruction::debugMode() const {
        return debugMode_;
    }

    Command Instruction::flatten() const {
        Command bytes;
        for (const auto &cmd: commands_) {
            bytes.insert(bytes.end(), cmd.begin(), cmd.end());
        }
        return bytes;
    }

    std::string Instruction::toString() const {
        std::ostringstream oss;
        oss << "[" << name_ << "]";

        if (!debugMode_) {
            return oss.str();
        }

        const Command bytes = flatten();
        if (*debugMode_ == DebugMode::Hex) {
            for (const auto byte: bytes) {
                oss << " " << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
                    << static_cast<int>(byte);
            }
        } else {
            oss << " [";
            for (size_t i = 0; i < bytes.size(); ++i) {
                if (i > 0) oss << ", ";
                oss << static_cast<int>(bytes[i]);
            }
            oss << "]";
        }
        return oss.str();
    }

    std::string debugModeToString(DebugMode mode) {
        return mode == DebugMode::Hex ? "hex" : "dec";
    }

    std::optional<DebugMode> debugModeFromString(const std::string &name) {
        if (name == "hex") return DebugMode::Hex;
        if (name == "dec") return DebugMode::Dec;
        return std::nullopt;
    }

} // namespace escpos
