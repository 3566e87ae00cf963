#include "httpool/connection/connection_pool.hpp"

#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <cassert>
#include <exception>
#include <stdexcept>

#include "httpool/log.hpp"

namespace httpool {

    namespace {

        Result<ConnectionPtr> pool_closed() {
            return Result<ConnectionPtr>::err(Error::Code::PoolClosed,
                                              "Connection pool is closed");
        }

    }  // namespace

    /// @brief Rendezvous between a pool completion and the coroutine parked
    /// in acquire(); the timer doubles as deadline and wake-up.
    ///
    /// Owned by the coroutine frame and by the pending wake-up only. Whatever
    /// the coroutine did not take when the last owner lets go goes back to
    /// the pool: a parked request is withdrawn, a delivered connection is
    /// returned.
    struct ConnectionPool::AcquireSlot {
        AcquireSlot(boost::asio::any_io_executor const& ex,
                    std::weak_ptr<ConnectionPool> owner, RequestKey k)
            : timer(ex), pool(std::move(owner)), key(std::move(k)) {}

        AcquireSlot(AcquireSlot const&) = delete;
        AcquireSlot& operator=(AcquireSlot const&) = delete;

        ~AcquireSlot();

        /// Pool side, any thread
        void put(Result<ConnectionPtr> r) {
            std::lock_guard<std::mutex> lk(mu);
            result.emplace(std::move(r));
        }

        /// Coroutine side; a taken result belongs to the caller
        std::optional<Result<ConnectionPtr>> take() {
            std::lock_guard<std::mutex> lk(mu);
            if (!result) return std::nullopt;
            settled = true;
            std::optional<Result<ConnectionPtr>> r = std::move(result);
            result.reset();
            return r;
        }

        /// Coroutine side, after its request was withdrawn
        void settle() {
            std::lock_guard<std::mutex> lk(mu);
            settled = true;
        }

        boost::asio::steady_timer timer;
        std::weak_ptr<ConnectionPool> pool;
        RequestKey key;
        AcquireTicket ticket;

        std::mutex mu;  ///< Guards result and settled
        std::optional<Result<ConnectionPtr>> result;
        bool settled{false};  ///< Taken or timed out, nothing left to undo
    };

    ConnectionPool::AcquireSlot::~AcquireSlot() {
        if (settled) return;

        auto owner = pool.lock();
        if (!result) {
            if (!owner || !ticket.pending()) return;
            try {
                owner->withdraw_(ticket.id);
            } catch (std::exception const& e) {
                owner->log_->error("Could not withdraw abandoned acquire: {}",
                                   e.what());
            }
            return;
        }

        if (!result->has_value()) return;
        ConnectionPtr const& conn = result->value();
        if (owner) {
            owner->give_back_(key, conn, true);
        } else if (conn) {
            conn->close();
        }
    }

    // ---- Lease ----

    void ConnectionPool::Lease::release(bool keep_alive) noexcept {
        if (!conn_) return;

        ConnectionPtr conn = std::move(conn_);
        bool reuse = keep_alive && reusable_;
        reusable_ = true;

        if (auto pool = pool_.lock()) {
            pool->give_back_(key_, conn, reuse);
        } else {
            // Nobody is left to account for it
            conn->close();
        }
    }

    // ---- construction ----

    std::shared_ptr<ConnectionPool> ConnectionPool::create(
        boost::asio::any_io_executor ex,
        std::shared_ptr<ConnectionBuilder> builder, PoolConfiguration cfg) {
        return std::make_shared<ConnectionPool>(Private{}, std::move(ex),
                                                std::move(builder), cfg);
    }

    ConnectionPool::ConnectionPool(Private, boost::asio::any_io_executor ex,
                                   std::shared_ptr<ConnectionBuilder> builder,
                                   PoolConfiguration cfg)
        : ex_(std::move(ex)),
          builder_(std::move(builder)),
          cfg_(cfg),
          log_(log::logger()) {
        if (cfg_.max_total_connections == 0) {
            throw std::invalid_argument(
                "max_total_connections must be at least 1");
        }
        if (!builder_) {
            throw std::invalid_argument("ConnectionPool requires a builder");
        }
    }

    ConnectionPool::~ConnectionPool() { shutdown(); }

    // ---- acquisition ----

    AcquireTicket ConnectionPool::async_acquire(RequestKey key,
                                                AcquireHandler handler) {
        key.normalize();

        Deferred d;
        AcquireTicket ticket;
        {
            std::lock_guard<std::mutex> lk(mu_);
            trace_locked_("Requesting connection", key);

            if (closed_) {
                metrics_.acquire_pool_closed.fetch_add(
                    1, std::memory_order_relaxed);
                d.completions.push_back({std::move(handler), pool_closed()});
            } else if (ConnectionPtr conn = take_idle_locked_(key)) {
                trace_locked_("Recycling connection", key);
                metrics_.connection_reused.fetch_add(1,
                                                     std::memory_order_relaxed);
                deliver_locked_(std::move(handler), std::move(conn), d);
            } else {
                if (!idle_.empty()) {
                    trace_locked_(
                        "No connections available for the desired key, "
                        "evicting and creating a connection",
                        key);
                    evict_oldest_idle_locked_(d);
                } else {
                    trace_locked_(
                        "No connections available, waiting on new connection",
                        key);
                }
                start_build_locked_(key, d);
                ticket = enqueue_waiter_locked_(key, std::move(handler));
            }

            publish_gauges_locked_();
            check_invariants_locked_();
        }

        run_deferred_(d);
        return ticket;
    }

    boost::asio::awaitable<Result<ConnectionPool::Lease>>
    ConnectionPool::acquire(RequestKey key, clock_type::duration timeout) {
        key.normalize();
        auto self = shared_from_this();

        auto ex = co_await boost::asio::this_coro::executor;
        auto slot = std::make_shared<AcquireSlot>(ex, weak_from_this(), key);

        // Handle infinite timeout
        if (timeout == clock_type::duration::max()) {
            slot->timer.expires_at(clock_type::time_point::max());
        } else {
            slot->timer.expires_after(timeout);
        }

        // The handler holds the slot weakly so an abandoned coroutine does
        // not keep its timer alive past the caller's executor
        std::weak_ptr<AcquireSlot> weak_slot = slot;
        slot->ticket = async_acquire(
            key, [weak_slot, owner = weak_from_this(),
                  key](Result<ConnectionPtr> r) {
                if (auto s = weak_slot.lock()) {
                    s->put(std::move(r));
                    boost::asio::post(s->timer.get_executor(),
                                      [s] { s->timer.cancel(); });
                    return;
                }

                // Caller went away after the waiter was handed this result
                if (!r.has_value() || !r.value()) return;
                if (auto pool = owner.lock()) {
                    pool->give_back_(key, r.value(), true);
                } else {
                    r.value()->close();
                }
            });

        std::optional<Result<ConnectionPtr>> r;
        for (;;) {
            boost::system::error_code ec;
            co_await slot->timer.async_wait(
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));

            r = slot->take();
            if (r) break;
            if (ec == boost::asio::error::operation_aborted) continue;
            if (ec) {
                co_return Result<Lease>::err(
                    Error::Code::Unknown, "Internal error: " + ec.message());
            }

            // Deadline passed while parked
            if (withdraw_(slot->ticket.id)) {
                slot->settle();
                metrics_.acquire_timeout.fetch_add(1,
                                                   std::memory_order_relaxed);
                co_return Result<Lease>::err(Error::Code::Timeout,
                                             "Acquire timeout");
            }

            // Already answered, the completion is on its way
            slot->timer.expires_at(clock_type::time_point::max());
        }

        if (r->has_error()) co_return Result<Lease>::err(std::move(*r).error());

        co_return Result<Lease>::ok(
            Lease(weak_from_this(), std::move(key), std::move(*r).value()));
    }

    std::optional<ConnectionPool::Lease> ConnectionPool::try_acquire(
        RequestKey key) {
        key.normalize();

        Deferred d;
        std::optional<Lease> lease;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_) {
                metrics_.acquire_pool_closed.fetch_add(
                    1, std::memory_order_relaxed);
                return std::nullopt;
            }

            std::size_t before = open_count_;
            if (ConnectionPtr conn = take_idle_locked_(key)) {
                trace_locked_("Recycling connection", key);
                metrics_.connection_reused.fetch_add(1,
                                                     std::memory_order_relaxed);
                metrics_.acquire_success.fetch_add(1,
                                                   std::memory_order_relaxed);
                leased_.insert(conn.get());
                lease = Lease(weak_from_this(), key, std::move(conn));
            }

            // Stale entries gave capacity back; spend it on parked demand
            if (open_count_ < before && !waiters_.empty()) {
                start_build_locked_(waiters_.front().key, d);
            }

            publish_gauges_locked_();
            check_invariants_locked_();
        }

        run_deferred_(d);
        return lease;
    }

    bool ConnectionPool::cancel(AcquireTicket ticket) {
        if (!ticket.pending()) return false;

        Deferred d;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto handler = withdraw_locked_(ticket.id);
            if (!handler) return false;

            metrics_.acquire_cancelled.fetch_add(1, std::memory_order_relaxed);
            d.completions.push_back(
                {std::move(*handler),
                 Result<ConnectionPtr>::err(Error::Code::Cancelled,
                                            "Acquire cancelled")});
            publish_gauges_locked_();
        }

        run_deferred_(d);
        return true;
    }

    void ConnectionPool::give_back_(RequestKey const& key,
                                    ConnectionPtr const& conn,
                                    bool keep_alive) noexcept {
        try {
            release(key, conn, keep_alive);
        } catch (std::exception const& e) {
            conn->close();
            log_->error("Closing connection to {}:{} that could not be "
                        "returned: {}",
                        key.host, key.port, e.what());
        }
    }

    bool ConnectionPool::withdraw_(std::uint64_t ticket) {
        std::lock_guard<std::mutex> lk(mu_);
        bool removed = withdraw_locked_(ticket).has_value();
        publish_gauges_locked_();
        return removed;
    }

    // ---- return / dispose ----

    void ConnectionPool::release(RequestKey key, ConnectionPtr const& conn,
                                 bool keep_alive) {
        if (!conn) return;
        key.normalize();

        Deferred d;
        {
            std::lock_guard<std::mutex> lk(mu_);

            if (leased_.erase(conn.get()) == 0) {
                metrics_.release_unknown.fetch_add(1,
                                                   std::memory_order_relaxed);
                log_->warn(
                    "Ignoring release of a connection to {} that is not "
                    "handed out by this pool",
                    to_string(key));
                return;
            }

            if (keep_alive) {
                trace_locked_("Reallocating connection", key);
                return_connection_locked_(key, conn, d);
            } else {
                trace_locked_("Disposing of connection", key);
                dispose_connection_locked_(key, conn, d);
            }

            publish_gauges_locked_();
            check_invariants_locked_();
        }

        run_deferred_(d);
    }

    void ConnectionPool::return_connection_locked_(RequestKey const& key,
                                                   ConnectionPtr const& conn,
                                                   Deferred& d) {
        if (closed_) {
            // open_count_ was reset at shutdown; only the socket is left
            if (conn->is_open()) {
                trace_locked_("Shutting down connection after pool closure",
                              key);
                d.closes.push_back(conn);
            }
            return;
        }

        if (conn->is_open()) {
            if (auto handler = pop_waiter_for_key_locked_(key)) {
                trace_locked_("Fulfilling waiting connection request", key);
                deliver_locked_(std::move(*handler), conn, d);
            } else {
                trace_locked_("Returning idle connection to pool", key);
                push_idle_locked_(key, conn);
            }
            return;
        }

        metrics_.stale_discarded.fetch_add(1, std::memory_order_relaxed);
        release_slot_locked_();
        if (!waiters_.empty()) {
            trace_locked_("Replacing closed connection", key);
            start_build_locked_(waiters_.front().key, d);
        } else {
            trace_locked_(
                "Connection was closed, but nothing to do, shrinking pool",
                key);
        }
    }

    void ConnectionPool::dispose_connection_locked_(RequestKey const& key,
                                                    ConnectionPtr const& conn,
                                                    Deferred& d) {
        if (conn && conn->is_open()) d.closes.push_back(conn);
        if (closed_) return;

        release_slot_locked_();
        if (!waiters_.empty()) {
            trace_locked_("Replacing failed connection", key);
            start_build_locked_(waiters_.front().key, d);
        }
    }

    // ---- builds ----

    void ConnectionPool::start_build_locked_(RequestKey const& key,
                                             Deferred& d) {
        if (closed_) return;

        if (open_count_ < cfg_.max_total_connections) {
            ++open_count_;
            trace_locked_("Creating connection", key);
            d.builds.push_back(key);
        } else {
            trace_locked_(
                "Too many connections open, can't create a connection", key);
        }
    }

    void ConnectionPool::launch_build_(RequestKey const& key) {
        std::weak_ptr<ConnectionPool> weak = weak_from_this();
        try {
            builder_->async_build(
                key, [weak, key](Result<ConnectionPtr> r) {
                    if (auto self = weak.lock()) {
                        self->on_build_complete_(key, std::move(r));
                    } else if (r.has_value() && r.value()) {
                        r.value()->close();
                    }
                });
        } catch (std::exception const& e) {
            on_build_complete_(
                key, Result<ConnectionPtr>::err(Error::Code::BuildFailed,
                                                e.what()));
        }
    }

    void ConnectionPool::on_build_complete_(RequestKey const& key,
                                            Result<ConnectionPtr> r) {
        Deferred d;
        {
            std::lock_guard<std::mutex> lk(mu_);

            if (r.has_value() && r.value()) {
                metrics_.connection_built.fetch_add(1,
                                                    std::memory_order_relaxed);
                build_failures_.erase(key);
                trace_locked_("Submitting fresh connection to pool", key);
                return_connection_locked_(key, r.value(), d);
            } else {
                Error err = r.has_error()
                                ? r.error()
                                : Error{Error::Code::BuildFailed,
                                        "Builder produced no connection"};
                metrics_.build_failed.fetch_add(1, std::memory_order_relaxed);
                log_->error("Error establishing connection to {}: {} ({})",
                            to_string(key), err.message,
                            to_string(err.code));

                // Only keys somebody still waits on are counted
                if (!closed_ && cfg_.max_consecutive_build_failures > 0 &&
                    waiters_by_key_.find(key) != waiters_by_key_.end() &&
                    ++build_failures_[key] >=
                        cfg_.max_consecutive_build_failures) {
                    fail_waiters_for_key_locked_(key, err, d);
                }
                dispose_connection_locked_(key, nullptr, d);
            }

            publish_gauges_locked_();
            check_invariants_locked_();
        }

        run_deferred_(d);
    }

    // ---- shutdown ----

    void ConnectionPool::shutdown() {
        Deferred d;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_) return;

            log_->info(
                "Shutting down connection pool: open={} idle={} waiting={}",
                open_count_, idle_.size(), waiters_.size());

            closed_ = true;
            for (auto& e : idle_) d.closes.push_back(std::move(e.conn));
            idle_.clear();
            idle_by_key_.clear();
            open_count_ = 0;
            build_failures_.clear();

            if (cfg_.fail_waiters_on_shutdown) {
                for (auto& w : waiters_) {
                    metrics_.acquire_pool_closed.fetch_add(
                        1, std::memory_order_relaxed);
                    d.completions.push_back(
                        {std::move(w.handler), pool_closed()});
                }
                waiters_.clear();
                waiters_by_key_.clear();
                waiters_by_ticket_.clear();
            }

            publish_gauges_locked_();
            check_invariants_locked_();
        }

        run_deferred_(d);
    }

    boost::asio::awaitable<bool> ConnectionPool::drain(
        clock_type::duration timeout) {
        auto self = shared_from_this();
        auto now = clock_type::now();
        auto deadline = timeout >= clock_type::time_point::max() - now
                            ? clock_type::time_point::max()
                            : now + timeout;
        boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);

        for (;;) {
            {
                std::lock_guard<std::mutex> lk(mu_);
                if (leased_.empty()) co_return true;
            }
            if (clock_type::now() >= deadline) co_return false;

            // Wait a bit before checking again
            timer.expires_after(std::chrono::milliseconds(10));
            co_await timer.async_wait(boost::asio::use_awaitable);
        }
    }

    PoolStats ConnectionPool::stats() const {
        std::lock_guard<std::mutex> lk(mu_);
        PoolStats s;
        s.open_count = open_count_;
        s.idle = idle_.size();
        s.waiting = waiters_.size();
        s.leased = leased_.size();
        s.failing_keys = build_failures_.size();
        s.closed = closed_;
        return s;
    }

    // ---- idle set ----

    ConnectionPtr ConnectionPool::take_idle_locked_(RequestKey const& key) {
        for (;;) {
            auto it = idle_by_key_.find(key);
            if (it == idle_by_key_.end()) return nullptr;

            IdleList::iterator entry = it->second.front();
            it->second.pop_front();
            if (it->second.empty()) idle_by_key_.erase(it);

            ConnectionPtr conn = std::move(entry->conn);
            idle_.erase(entry);

            if (conn->is_open()) return conn;

            trace_locked_("Evicting closed connection", key);
            metrics_.stale_discarded.fetch_add(1, std::memory_order_relaxed);
            release_slot_locked_();
        }
    }

    void ConnectionPool::push_idle_locked_(RequestKey const& key,
                                           ConnectionPtr conn) {
        auto entry = idle_.insert(
            idle_.end(), IdleEntry{key, std::move(conn), clock_type::now()});
        idle_by_key_[key].push_back(entry);
    }

    void ConnectionPool::evict_oldest_idle_locked_(Deferred& d) {
        IdleList::iterator oldest = idle_.begin();

        // The globally oldest entry is also the oldest of its key
        auto it = idle_by_key_.find(oldest->key);
        assert(it != idle_by_key_.end() && it->second.front() == oldest &&
               "idle index out of step with idle list");
        it->second.pop_front();
        if (it->second.empty()) idle_by_key_.erase(it);

        metrics_.connection_evicted.fetch_add(1, std::memory_order_relaxed);
        d.closes.push_back(std::move(oldest->conn));
        idle_.erase(oldest);
        release_slot_locked_();
    }

    // ---- wait list ----

    AcquireTicket ConnectionPool::enqueue_waiter_locked_(
        RequestKey const& key, AcquireHandler handler) {
        std::uint64_t id = next_ticket_++;
        auto w = waiters_.insert(waiters_.end(),
                                 Waiter{key, id, std::move(handler)});
        waiters_by_key_[key].push_back(w);
        waiters_by_ticket_.emplace(id, w);
        return AcquireTicket{id};
    }

    std::optional<ConnectionPool::AcquireHandler>
    ConnectionPool::pop_waiter_for_key_locked_(RequestKey const& key) {
        auto it = waiters_by_key_.find(key);
        if (it == waiters_by_key_.end()) return std::nullopt;

        WaitList::iterator w = it->second.front();
        it->second.pop_front();
        if (it->second.empty()) drop_waiter_bucket_locked_(key);

        AcquireHandler handler = std::move(w->handler);
        waiters_by_ticket_.erase(w->ticket);
        waiters_.erase(w);
        return handler;
    }

    std::optional<ConnectionPool::AcquireHandler>
    ConnectionPool::withdraw_locked_(std::uint64_t ticket) {
        auto t = waiters_by_ticket_.find(ticket);
        if (t == waiters_by_ticket_.end()) return std::nullopt;

        WaitList::iterator w = t->second;
        waiters_by_ticket_.erase(t);

        auto it = waiters_by_key_.find(w->key);
        assert(it != waiters_by_key_.end() && "waiter missing from key index");
        auto& queue = it->second;
        queue.erase(std::find(queue.begin(), queue.end(), w));
        if (queue.empty()) drop_waiter_bucket_locked_(w->key);

        AcquireHandler handler = std::move(w->handler);
        waiters_.erase(w);
        return handler;
    }

    void ConnectionPool::fail_waiters_for_key_locked_(RequestKey const& key,
                                                      Error const& err,
                                                      Deferred& d) {
        auto it = waiters_by_key_.find(key);
        if (it == waiters_by_key_.end()) return;

        Error failure{err.code, "Giving up on " + to_string(key) + " after " +
                                    std::to_string(
                                        cfg_.max_consecutive_build_failures) +
                                    " failed builds: " + err.message};

        for (WaitList::iterator w : it->second) {
            metrics_.waiter_build_failed.fetch_add(1,
                                                   std::memory_order_relaxed);
            d.completions.push_back(
                {std::move(w->handler), Result<ConnectionPtr>::err(failure)});
            waiters_by_ticket_.erase(w->ticket);
            waiters_.erase(w);
        }
        drop_waiter_bucket_locked_(key);
    }

    void ConnectionPool::drop_waiter_bucket_locked_(RequestKey const& key) {
        waiters_by_key_.erase(key);
        build_failures_.erase(key);
    }

    // ---- helpers ----

    void ConnectionPool::deliver_locked_(AcquireHandler handler,
                                         ConnectionPtr conn, Deferred& d) {
        leased_.insert(conn.get());
        metrics_.acquire_success.fetch_add(1, std::memory_order_relaxed);
        d.completions.push_back(
            {std::move(handler), Result<ConnectionPtr>::ok(std::move(conn))});
    }

    void ConnectionPool::release_slot_locked_() {
        assert(open_count_ > 0 && "open_count would go negative");
        if (open_count_ == 0) {
            log_->critical("open_count underflow prevented");
            return;
        }
        --open_count_;
    }

    void ConnectionPool::run_deferred_(Deferred& d) {
        for (auto& conn : d.closes) {
            if (conn) conn->close();
        }

        // Builders may complete inline; posting keeps a failing builder
        // from recursing through the replacement-build path
        std::weak_ptr<ConnectionPool> weak = weak_from_this();
        for (auto& key : d.builds) {
            boost::asio::post(ex_, [weak, key = std::move(key)] {
                if (auto self = weak.lock()) self->launch_build_(key);
            });
        }

        for (auto& c : d.completions) {
            boost::asio::post(
                ex_, [handler = std::move(c.handler),
                      result = std::move(c.result)]() mutable {
                    handler(std::move(result));
                });
        }
    }

    void ConnectionPool::publish_gauges_locked_() {
        metrics_.open.store(open_count_, std::memory_order_relaxed);
        metrics_.idle.store(idle_.size(), std::memory_order_relaxed);
        metrics_.waiting.store(waiters_.size(), std::memory_order_relaxed);
        metrics_.leased.store(leased_.size(), std::memory_order_relaxed);
    }

    void ConnectionPool::trace_locked_(const char* what,
                                       RequestKey const& key) const {
        if (!log_->should_log(spdlog::level::debug)) return;
        log_->debug("{} [{}]: open={} idle={} waiting={}", what,
                    to_string(key), open_count_, idle_.size(),
                    waiters_.size());
    }

    /// @brief Check internal invariants, only in debug builds
    void ConnectionPool::check_invariants_locked_() const {
#ifndef NDEBUG
        std::size_t indexed_idle = 0;
        for (auto const& [key, entries] : idle_by_key_) {
            assert(!entries.empty() && "empty idle bucket left behind");
            indexed_idle += entries.size();
            for (auto const& e : entries) {
                assert(e->key == key && "idle entry under the wrong key");
                assert(leased_.find(e->conn.get()) == leased_.end() &&
                       "connection both idle and leased");
            }
        }
        assert(indexed_idle == idle_.size() && "idle index drift");

        std::size_t indexed_waiters = 0;
        for (auto const& [key, queue] : waiters_by_key_) {
            assert(!queue.empty() && "empty waiter bucket left behind");
            indexed_waiters += queue.size();
        }
        assert(indexed_waiters == waiters_.size() && "waiter index drift");
        assert(waiters_by_ticket_.size() == waiters_.size() &&
               "ticket index drift");
        for (auto const& entry : build_failures_) {
            assert(waiters_by_key_.count(entry.first) != 0 &&
                   "failure count kept for a key nobody waits on");
        }

        if (closed_) {
            assert(open_count_ == 0 && "closed pool still counts connections");
            assert(idle_.empty() && "closed pool still holds idle connections");
        } else {
            assert(open_count_ <= cfg_.max_total_connections &&
                   "open_count exceeds capacity");
            assert(idle_.size() + leased_.size() <= open_count_ &&
                   "uncounted connection");
        }
#else
        return;
#endif
    }

}  // namespace httpool
