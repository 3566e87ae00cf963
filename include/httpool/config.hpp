#pragma once
#include <chrono>
#include <cstddef>

namespace httpool {
    /**
     * @brief Configuration for the connection pool.
     */
    struct PoolConfiguration {
        /** @brief Maximum connections open or being opened, across all keys. */
        std::size_t max_total_connections{10};

        /**
         * @brief Resolve waiters still pending at shutdown with PoolClosed.
         *
         * When false, waiters parked at shutdown are abandoned and only a
         * caller-side timeout or cancel() ends them.
         */
        bool fail_waiters_on_shutdown{true};

        /**
         * @brief Consecutive build failures for one key after which that key's
         * waiters are failed with the build error. 0 keeps retrying silently
         * for as long as anyone waits.
         */
        std::size_t max_consecutive_build_failures{0};
    };

    /**
     * @brief Configuration for the TCP/TLS connection builder.
     */
    struct TcpBuilderConfiguration {
        /** @brief Timeout for resolving, connecting and the TLS handshake. */
        std::chrono::milliseconds connect_timeout{5000};

        /** @brief Whether to verify server certificates. */
        bool verify_tls{true};
    };
}  // namespace httpool
