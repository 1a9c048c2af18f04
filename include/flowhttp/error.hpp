#pragma once
#include <string>

namespace flowhttp {
    /**
     * @brief Represents an error that terminated an HTTP exchange or one of
     * its stages.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            InvalidUrl,     /**< The provided URL is malformed or invalid. */
            InvalidRequest, /**< Unknown method, invalid limits or headers. */
            ConnectFailed,  /**< TCP connect or TLS handshake failed. */
            Timeout,        /**< Acquire, connect or exchange deadline hit. */
            ProtocolViolation, /**< Framing limit exceeded or malformed. */
            Aborted,  /**< Peer closed unexpectedly or exchange cancelled. */
            RedirectLimitExceeded, /**< Redirect chain longer than bound. */
            Shutdown,              /**< The connection pool is closed. */
        };

        /** @brief The error code. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;
    };

    /// @brief Convert an error code to a stable name for logs and metrics.
    inline const char* to_string(Error::Code code) noexcept {
        switch (code) {
            case Error::Code::InvalidUrl:
                return "InvalidUrl";
            case Error::Code::InvalidRequest:
                return "InvalidRequest";
            case Error::Code::ConnectFailed:
                return "ConnectFailed";
            case Error::Code::Timeout:
                return "Timeout";
            case Error::Code::ProtocolViolation:
                return "ProtocolViolation";
            case Error::Code::Aborted:
                return "Aborted";
            case Error::Code::RedirectLimitExceeded:
                return "RedirectLimitExceeded";
            case Error::Code::Shutdown:
                return "Shutdown";
        }
        return "Unknown";
    }
}  // namespace flowhttp
