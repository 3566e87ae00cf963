#pragma once

#include <functional>
#include <memory>

#include "../request_key.hpp"  // RequestKey
#include "../result.hpp"       // Result, Error

namespace httpool {

    /**
     * @brief One established transport/session to a destination.
     *
     * The pool only relies on the three members below. Implementations must
     * make is_open() and close() safe to call from any thread; the peer may
     * close the connection at any time, so is_open() can flip to false
     * without the pool's involvement.
     */
    class Connection {
       public:
        virtual ~Connection() = default;

        /** @brief The key the connection was built for, fixed for its life. */
        virtual RequestKey const& key() const noexcept = 0;

        /** @brief Whether the connection can still carry a request. */
        virtual bool is_open() const noexcept = 0;

        /** @brief Close the connection. Idempotent. */
        virtual void close() noexcept = 0;
    };

    using ConnectionPtr = std::shared_ptr<Connection>;

    /**
     * @brief Produces new connections for a key (DNS, TCP, TLS, ...).
     *
     * async_build() must invoke the handler exactly once, either inline or
     * later from any thread. A failed build must not leave a half-open
     * connection behind.
     */
    class ConnectionBuilder {
       public:
        using BuildHandler = std::function<void(Result<ConnectionPtr>)>;

        virtual ~ConnectionBuilder() = default;

        virtual void async_build(RequestKey const& key,
                                 BuildHandler handler) = 0;
    };

}  // namespace httpool
