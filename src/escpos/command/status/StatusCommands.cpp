#include "escpos/command/status/StatusCommands.hpp"
#include "escpos/CommandBuilder.hpp"
#include "escpos/Constants.hpp"

namespace escpos::command::status {

    using namespace escpos::constants;

    StatusCommands::StatusCommands(Protocol *protocol)
            : CommandCategoryInterface(protocol) {}

    Command StatusCommands::realTimeStatus(domain::status::RealTimeStatusRequest request) const {
        const auto [n, a] = domain::status::requestBytes(request);
        return CommandBuilder::build({DLE, 0x04}, {n, a});
    }

} // namespace escpos::command::status
