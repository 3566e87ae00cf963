#pragma once
#include <string>

namespace httpool {
    /**
     * @brief Represents an error reported by the pool or by a connection
     * builder.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            PoolClosed,        /**< The pool has been shut down. */
            Cancelled,         /**< The pending acquisition was cancelled. */
            Timeout,           /**< The operation timed out. */
            BuildFailed,       /**< Building a connection failed. */
            ResolveFailed,     /**< Host name resolution failed. */
            ConnectionFailed,  /**< Failed to establish a TCP connection. */
            TlsHandshakeFailed,/**< Failed to perform TLS handshake. */
            InvalidUrl,        /**< The provided URL is malformed or invalid. */
            Unknown,           /**< An unknown error occurred. */
        };

        /** @brief The error code. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;
    };

    /// @brief Convert an error code to string for logging or diagnostics
    inline const char* to_string(Error::Code code) {
        switch (code) {
            case Error::Code::PoolClosed:
                return "PoolClosed";
            case Error::Code::Cancelled:
                return "Cancelled";
            case Error::Code::Timeout:
                return "Timeout";
            case Error::Code::BuildFailed:
                return "BuildFailed";
            case Error::Code::ResolveFailed:
                return "ResolveFailed";
            case Error::Code::ConnectionFailed:
                return "ConnectionFailed";
            case Error::Code::TlsHandshakeFailed:
                return "TlsHandshakeFailed";
            case Error::Code::InvalidUrl:
                return "InvalidUrl";
            case Error::Code::Unknown:
                return "Unknown";
        }
        return "Unknown";
    }
}  // namespace httpool
