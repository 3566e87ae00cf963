#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "fake_connection.hpp"
#include "httpool/connection/connection_pool.hpp"

using httpool::ConnectionPool;
using httpool::ConnectionPtr;
using httpool::PoolConfiguration;
using httpool::RequestKey;
using httpool::Result;
using httpool::Scheme;
using httpool::testing::ScriptedBuilder;

static void print_result(const char* label, int iters,
                         std::chrono::nanoseconds total,
                         std::chrono::nanoseconds min,
                         std::chrono::nanoseconds max) {
    const double total_ms =
        std::chrono::duration<double, std::milli>(total).count();
    const double avg_us =
        std::chrono::duration<double, std::micro>(total).count() / iters;
    const double min_us =
        std::chrono::duration<double, std::micro>(min).count();
    const double max_us =
        std::chrono::duration<double, std::micro>(max).count();

    std::cout << "\n[ PERF ] " << label << "\n"
              << "        iters=" << iters << " total_ms=" << std::fixed
              << std::setprecision(2) << total_ms << " avg_us=" << std::fixed
              << std::setprecision(2) << avg_us << " min_us=" << std::fixed
              << std::setprecision(2) << min_us << " max_us=" << std::fixed
              << std::setprecision(2) << max_us << "\n";
}

static void print_ops(const char* label, std::chrono::nanoseconds elapsed,
                      std::uint64_t total_ops) {
    const double secs = std::chrono::duration<double>(elapsed).count();
    const double avg = secs > 0 ? (double)total_ops / secs : 0.0;

    std::cout << "\n[ PERF ] " << label << "\n"
              << "        duration_s=" << std::fixed << std::setprecision(2)
              << secs << " total_ops=" << total_ops
              << " avg_ops_per_s=" << std::fixed << std::setprecision(0)
              << avg << "\n";
}

TEST(ConnectionPoolPerf, WarmAcquireReleaseSequential) {
    constexpr int iters = 20000;

    boost::asio::io_context ioc(1);
    PoolConfiguration cfg;
    cfg.max_total_connections = 4;
    auto pool = ConnectionPool::create(
        ioc.get_executor(), std::make_shared<ScriptedBuilder>(true), cfg);
    RequestKey key{Scheme::Http, "perf.local", "80"};

    using clock = std::chrono::steady_clock;
    std::chrono::nanoseconds total{0};
    std::chrono::nanoseconds min = std::chrono::nanoseconds::max();
    std::chrono::nanoseconds max{0};

    bool success = true;

    boost::asio::co_spawn(ioc, [&]() -> boost::asio::awaitable<void> {
        // Warm-up builds the connection
        {
            auto r = co_await pool->acquire(key);
            if (!r) {
                success = false;
                co_return;
            }
        }

        for (int i = 0; i < iters; ++i) {
            const auto t0 = clock::now();
            {
                auto r = co_await pool->acquire(key);
                if (!r) {
                    success = false;
                    break;
                }
            }
            const auto t1 = clock::now();

            const auto dt =
                std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0);
            total += dt;
            min = std::min(min, dt);
            max = std::max(max, dt);
        }
    }, boost::asio::detached);

    ioc.run();

    ASSERT_TRUE(success);
    EXPECT_EQ(pool->metrics().connection_built.load(), 1u);
    print_result("Warm acquire+release (coroutine, one key) SEQUENTIAL", iters,
                 total, min, max);
}

TEST(ConnectionPoolPerf, ContendedHandlersAcrossKeys) {
    constexpr int requests = 200000;
    constexpr int keys = 8;
    const unsigned threads = std::max(2u, std::thread::hardware_concurrency());

    boost::asio::io_context ioc(static_cast<int>(threads));
    PoolConfiguration cfg;
    cfg.max_total_connections = 16;
    auto pool = ConnectionPool::create(
        ioc.get_executor(), std::make_shared<ScriptedBuilder>(true), cfg);

    std::vector<RequestKey> key_set;
    for (int k = 0; k < keys; ++k) {
        key_set.push_back(RequestKey{Scheme::Http, "host" + std::to_string(k), "80"});
    }

    std::atomic<std::uint64_t> done{0};

    using clock = std::chrono::steady_clock;
    const auto start = clock::now();

    for (int i = 0; i < requests; ++i) {
        RequestKey const& key = key_set[i % keys];
        pool->async_acquire(key, [&, key](Result<ConnectionPtr> r) {
            if (r) pool->release(key, r.value(), true);
            done.fetch_add(1, std::memory_order_relaxed);
        });
    }

    std::vector<std::thread> workers;
    for (unsigned t = 0; t < threads; ++t) {
        workers.emplace_back([&] { ioc.run_for(std::chrono::seconds(30)); });
    }
    for (auto& w : workers) w.join();

    const auto elapsed = clock::now() - start;

    // Keep-alive returns can leave other keys parked behind idle
    // connections; the rest resolve at shutdown
    pool->shutdown();
    ioc.restart();
    ioc.run();

    EXPECT_EQ(done.load(), static_cast<std::uint64_t>(requests));
    print_ops("async_acquire+release, 8 keys, 16 connections, all threads",
              std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed),
              done.load());
}
