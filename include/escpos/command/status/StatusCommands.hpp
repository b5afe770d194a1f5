#pragma once

#include "escpos/command/CommandCategoryInterface.hpp"
#include "escpos/domain/status/RealTimeStatus.hpp"

namespace escpos::command::status {

    class StatusCommands : public CommandCategoryInterface {
    public:
        explicit StatusCommands(Protocol *protocol);

        /// DLE EOT n a
        Command realTimeStatus(domain::status::RealTimeStatusRequest request) const;
    };

} // namespace escpos::command::status
