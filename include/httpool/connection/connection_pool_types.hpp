#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace httpool {

    /// @brief Handle on a pending acquisition, used to cancel it.
    /// @note id 0 means the acquisition never waited (it was answered
    /// straight away) and there is nothing to cancel.
    struct AcquireTicket {
        std::uint64_t id{0};

        bool pending() const noexcept { return id != 0; }

        friend bool operator==(AcquireTicket a, AcquireTicket b) noexcept {
            return a.id == b.id;
        }
    };

    /// @brief Consistent snapshot of the pool state, taken under the lock.
    struct PoolStats {
        std::size_t open_count{0};  ///< Open or being opened
        std::size_t idle{0};        ///< Idle and reusable
        std::size_t waiting{0};     ///< Parked acquisitions
        std::size_t leased{0};      ///< Handed out, not yet released
        std::size_t failing_keys{0};  ///< Keys counting build failures
        bool closed{false};         ///< Shutdown has happened
    };

    /// @brief Metrics for monitoring connection pool behavior
    /// @note Gauges lag the locked state slightly; use stats() when an exact
    /// picture is needed.
    struct ConnectionPoolMetrics {
        // Gauges (current state)
        std::atomic<std::size_t> open{0};     ///< open_count
        std::atomic<std::size_t> idle{0};     ///< Currently idle
        std::atomic<std::size_t> waiting{0};  ///< Currently parked
        std::atomic<std::size_t> leased{0};   ///< Currently handed out

        // Counters (cumulative)
        std::atomic<std::uint64_t> acquire_success{0};  ///< Delivered leases
        std::atomic<std::uint64_t> acquire_pool_closed{
            0};                                         ///< Rejected, closed
        std::atomic<std::uint64_t> acquire_timeout{0};  ///< Acquire timed out
        std::atomic<std::uint64_t> acquire_cancelled{0};  ///< cancel() hits
        std::atomic<std::uint64_t> connection_built{0};   ///< Builds succeeded
        std::atomic<std::uint64_t> build_failed{0};       ///< Builds failed
        std::atomic<std::uint64_t> connection_reused{0};  ///< Idle reuse
        std::atomic<std::uint64_t> connection_evicted{
            0};  ///< Idle closed for another key
        std::atomic<std::uint64_t> stale_discarded{
            0};  ///< Found closed in idle or on return
        std::atomic<std::uint64_t> release_unknown{
            0};  ///< Released a connection not handed out
        std::atomic<std::uint64_t> waiter_build_failed{
            0};  ///< Waiters failed by the build-failure cap
    };

}  // namespace httpool
