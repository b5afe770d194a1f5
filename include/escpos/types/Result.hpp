#pragma once

#include <cstddef>
#include <string>

namespace escpos::types {

    enum class ResultCode {
        Success,
        Error,
        Timeout
    };

    struct Result {
        ResultCode code;
        std::string message;
        std::size_t bytes = 0;

        inline bool isSuccess() const {
            return code == ResultCode::Success;
        }

        inline bool isError() const {
            return code == ResultCode::Error;
        }

        inline bool isTimeout() const {
            return code == ResultCode::Timeout;
        }

        static inline Result success(const std::string &msg = "Success", std::size_t bytes = 0) {
            return {ResultCode::Success, msg, bytes};
        }

        static inline Result error(const std::string &msg = "Error") {
            return {ResultCode::Error, msg, 0};
        }

        static inline Result timeout(const std::string &msg = "Timeout") {
            return {ResultCode::Timeout, msg, 0};
        }
    };

} // namespace escpos::types
