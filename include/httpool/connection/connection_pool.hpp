#pragma once

#include <spdlog/logger.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "httpool/config.hpp"
#include "httpool/connection/connection.hpp"
#include "httpool/connection/connection_pool_types.hpp"
#include "httpool/error.hpp"
#include "httpool/request_key.hpp"
#include "httpool/result.hpp"

namespace httpool {

    /**
     * Keyed connection pool with a global bound on open connections.
     *
     * SAFETY:
     * - All public methods are thread-safe and can be called from any thread
     * - One mutex guards the open count, the idle set, the wait list and the
     *   closed flag
     * - Builders, Connection::close() of discarded connections and completion
     *   handlers all run outside the mutex; handlers are posted to the pool's
     *   executor and never run inline from a pool call
     *
     * INVARIANTS:
     * 1. While open: idle.size() + leased.size() <= open_count <= max
     * 2. No connection is both idle and leased
     * 3. Waiters of one key are served in arrival order
     * 4. Once closed: open_count == 0, idle is empty, no build is started
     *
     * ERRORS:
     * - PoolClosed: the pool was shut down, no acquisition will succeed
     * - Cancelled: cancel() withdrew the acquisition
     * - Timeout: acquire() deadline passed while parked
     * - Builder errors: only when max_consecutive_build_failures trips
     *
     * LIFECYCLE:
     * 1. create(): pool is open
     * 2. async_acquire()/acquire() and release() work normally
     * 3. shutdown(): closes idle connections, resolves waiters
     * 4. drain(): optionally wait for handed-out connections to come back
     * 5. Destruction: calls shutdown()
     */
    class ConnectionPool : public std::enable_shared_from_this<ConnectionPool> {
        struct Private {
            explicit Private() = default;
        };

       public:
        using AcquireHandler = std::function<void(Result<ConnectionPtr>)>;
        using clock_type = std::chrono::steady_clock;

        /// @brief RAII handle on an acquired connection; returns it to the
        /// pool on destruction.
        class Lease {
           public:
            Lease() = default;

            Lease(Lease&& other) noexcept { move_from(std::move(other)); }

            Lease& operator=(Lease&& other) noexcept {
                if (this != &other) {
                    release();
                    move_from(std::move(other));
                }
                return *this;
            }

            Lease(Lease const&) = delete;
            Lease& operator=(Lease const&) = delete;

            ~Lease() { release(); }

            Connection* operator->() const noexcept { return conn_.get(); }

            Connection& operator*() const { return *conn_; }

            /// @brief The held connection, or nullptr once released
            Connection* get() const noexcept { return conn_.get(); }

            ConnectionPtr const& connection() const noexcept { return conn_; }

            explicit operator bool() const noexcept { return conn_ != nullptr; }

            RequestKey const& key() const noexcept { return key_; }

            /// @brief Dispose of the connection instead of reusing it when
            /// the lease ends (e.g. the response said "Connection: close").
            void mark_unreusable() noexcept { reusable_ = false; }

            /// @brief Hand the connection back now. A lease that outlived its
            /// pool closes the connection instead, and so does a return the
            /// pool fails to record.
            void release(bool keep_alive = true) noexcept;

           private:
            friend class ConnectionPool;

            Lease(std::weak_ptr<ConnectionPool> pool, RequestKey key,
                  ConnectionPtr conn)
                : pool_(std::move(pool)),
                  key_(std::move(key)),
                  conn_(std::move(conn)) {}

            void move_from(Lease&& other) noexcept {
                pool_ = std::move(other.pool_);
                key_ = std::move(other.key_);
                conn_ = std::move(other.conn_);
                reusable_ = other.reusable_;
                other.conn_.reset();
                other.reusable_ = true;
            }

            std::weak_ptr<ConnectionPool> pool_;
            RequestKey key_{};
            ConnectionPtr conn_;
            bool reusable_{true};
        };

        /// @brief Create a pool. Build completions hold a weak reference to
        /// it, so pools only exist behind a shared_ptr.
        /// @throws std::invalid_argument if max_total_connections is 0
        static std::shared_ptr<ConnectionPool> create(
            boost::asio::any_io_executor ex,
            std::shared_ptr<ConnectionBuilder> builder,
            PoolConfiguration cfg = {});

        ConnectionPool(Private, boost::asio::any_io_executor ex,
                       std::shared_ptr<ConnectionBuilder> builder,
                       PoolConfiguration cfg);

        ConnectionPool(ConnectionPool const&) = delete;
        ConnectionPool& operator=(ConnectionPool const&) = delete;

        ~ConnectionPool();

        /// @brief Request a connection for key.
        /// @param handler Invoked exactly once on the pool executor with the
        /// connection or an error, unless the waiter is abandoned at shutdown
        /// (fail_waiters_on_shutdown == false).
        /// @return Ticket for cancel(); not pending when the request was
        /// answered without waiting.
        AcquireTicket async_acquire(RequestKey key, AcquireHandler handler);

        /// @brief Coroutine form of async_acquire returning a Lease.
        /// @param timeout How long to stay parked; max() waits indefinitely
        /// @note The calling coroutine's executor must not run handlers
        /// concurrently (single-threaded io_context or a strand). A coroutine
        /// destroyed while parked withdraws its request, and a connection
        /// delivered to it after that goes back to the pool.
        boost::asio::awaitable<Result<Lease>> acquire(
            RequestKey key,
            clock_type::duration timeout = clock_type::duration::max());

        /// @brief Take an idle connection for key if one is ready.
        /// @note Never builds, evicts or waits
        std::optional<Lease> try_acquire(RequestKey key);

        /// @brief Hand back a connection obtained from this pool. Must be
        /// called exactly once per delivered connection; later calls are
        /// ignored.
        /// @param keep_alive false disposes of the connection
        void release(RequestKey key, ConnectionPtr const& conn,
                     bool keep_alive);

        /// @brief Withdraw a parked acquisition; its handler gets Cancelled.
        /// @return false if it was already answered
        bool cancel(AcquireTicket ticket);

        /// Shut the pool down. Idempotent.
        void shutdown();

        /// Wait until every handed-out connection has been released
        /// @param timeout max() waits indefinitely
        boost::asio::awaitable<bool> drain(clock_type::duration timeout);

        PoolStats stats() const;

        ///@brief Access metrics for monitoring
        ConnectionPoolMetrics const& metrics() const noexcept {
            return metrics_;
        }

        PoolConfiguration const& config() const noexcept { return cfg_; }

        boost::asio::any_io_executor get_executor() const noexcept {
            return ex_;
        }

       private:
        struct AcquireSlot;

        struct IdleEntry {
            RequestKey key;
            ConnectionPtr conn;
            clock_type::time_point since;
        };

        struct Waiter {
            RequestKey key;
            std::uint64_t ticket;
            AcquireHandler handler;
        };

        using IdleList = std::list<IdleEntry>;
        using WaitList = std::list<Waiter>;

        /// @brief Work decided under the lock and carried out after it is
        /// released.
        struct Deferred {
            struct Completion {
                AcquireHandler handler;
                Result<ConnectionPtr> result;
            };

            std::vector<ConnectionPtr> closes;
            std::vector<RequestKey> builds;
            std::vector<Completion> completions;
        };

        void run_deferred_(Deferred& d);
        void launch_build_(RequestKey const& key);
        void on_build_complete_(RequestKey const& key, Result<ConnectionPtr> r);
        bool withdraw_(std::uint64_t ticket);
        void give_back_(RequestKey const& key, ConnectionPtr const& conn,
                        bool keep_alive) noexcept;

        ConnectionPtr take_idle_locked_(RequestKey const& key);
        void push_idle_locked_(RequestKey const& key, ConnectionPtr conn);
        void evict_oldest_idle_locked_(Deferred& d);

        AcquireTicket enqueue_waiter_locked_(RequestKey const& key,
                                             AcquireHandler handler);
        std::optional<AcquireHandler> pop_waiter_for_key_locked_(
            RequestKey const& key);
        std::optional<AcquireHandler> withdraw_locked_(std::uint64_t ticket);
        void drop_waiter_bucket_locked_(RequestKey const& key);
        void fail_waiters_for_key_locked_(RequestKey const& key,
                                          Error const& err, Deferred& d);

        void start_build_locked_(RequestKey const& key, Deferred& d);
        void return_connection_locked_(RequestKey const& key,
                                       ConnectionPtr const& conn, Deferred& d);
        void dispose_connection_locked_(RequestKey const& key,
                                        ConnectionPtr const& conn,
                                        Deferred& d);
        void deliver_locked_(AcquireHandler handler, ConnectionPtr conn,
                             Deferred& d);
        void release_slot_locked_();

        void publish_gauges_locked_();
        void trace_locked_(const char* what, RequestKey const& key) const;
        void check_invariants_locked_() const;

        boost::asio::any_io_executor ex_;  ///< Executor handlers are posted to
        std::shared_ptr<ConnectionBuilder> builder_;
        PoolConfiguration cfg_;
        std::shared_ptr<spdlog::logger> log_;

        mutable std::mutex mu_;  ///< Guards everything below
        bool closed_{false};
        std::size_t open_count_{0};  ///< Open or being built

        IdleList idle_;  ///< Oldest first, eviction order
        std::unordered_map<RequestKey, std::deque<IdleList::iterator>>
            idle_by_key_;  ///< Per-key index into idle_, oldest first

        WaitList waiters_;  ///< Arrival order across all keys
        std::unordered_map<RequestKey, std::deque<WaitList::iterator>>
            waiters_by_key_;  ///< Per-key index into waiters_
        std::unordered_map<std::uint64_t, WaitList::iterator>
            waiters_by_ticket_;
        std::uint64_t next_ticket_{1};

        std::unordered_set<Connection const*> leased_;  ///< Handed out
        std::unordered_map<RequestKey, std::size_t>
            build_failures_;  ///< Consecutive failures per waited-on key

        ConnectionPoolMetrics metrics_;
    };

}  // namespace httpool
