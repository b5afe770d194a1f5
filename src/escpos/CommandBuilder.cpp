#include "escpos/CommandBuilder.hpp"
#include "escpos/Constants.hpp"
#include "escpos/types/Error.hpp"

namespace escpos {

    std::array<uint8_t, 2> CommandBuilder::parameters2(uint64_t length, uint64_t padding) {
        const uint64_t total = length + padding;
        const uint64_t high = total / 256;
        if (high > 0xFF) {
            throw types::InputException("parameter length " + std::to_string(total) +
                                        " does not fit in 2 bytes (max 65535)");
        }
        const uint64_t low = total - 256 * high;
        return {static_cast<uint8_t>(low), static_cast<uint8_t>(high)};
    }

    std::array<uint8_t, 4> CommandBuilder::parameters4(uint64_t length, uint64_t padding) {
        uint64_t total = length + padding;
        if (total > 0xFFFFFFFFULL) {
            throw types::InputException("parameter length " + std::to_string(total) +
                                        " does not fit in 4 bytes (max 4294967295)");
        }

        std::array<uint8_t, 4> params{};
        for (auto &digit: params) {
            digit = static_cast<uint8_t>(total % 256);
            total /= 256;
        }
        return params;
    }

    uint64_t CommandBuilder::recompose(const std::array<uint8_t, 2> &params) {
        return static_cast<uint64_t>(params[0]) + 256 * static_cast<uint64_t>(params[1]);
    }

    uint64_t CommandBuilder::recompose(const std::array<uint8_t, 4> &params) {
        uint64_t total = 0;
        for (auto it = params.rbegin(); it != params.rend(); ++it) {
            total = total * 256 + *it;
        }
        return total;
    }

    Command CommandBuilder::frame(uint8_t cn, uint8_t fn, const std::vector<uint8_t> &params) {
        const auto [pL, pH] = parameters2(params.size(), 2);

        Command cmd = {constants::GS, 0x28, 0x6B, pL, pH, cn, fn};
        cmd.insert(cmd.end(), params.begin(), params.end());
        return cmd;
    }

    Command CommandBuilder::dataFrame(uint8_t cn, const std::vector<uint8_t> &header, const std::string &data) {
        std::vector<uint8_t> params = {constants::STORE_PRINT_M};
        params.insert(params.end(), header.begin(), header.end());
        params.insert(params.end(), data.begin(), data.end());
        return frame(cn, constants::FN_STORE_DATA, params);
    }

    Command CommandBuilder::build(std::initializer_list<uint8_t> prefix, std::initializer_list<uint8_t> args) {
        Command cmd(prefix);
        cmd.insert(cmd.end(), args.begin(), args.end());
        return cmd;
    }

} // namespace escpos
