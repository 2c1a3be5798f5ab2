#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "respool/log.hpp"
#include "respool/pool/pool.hpp"
#include "respool/resource.hpp"

static void print_result(const char* label, int iters,
                         std::chrono::nanoseconds total,
                         std::chrono::nanoseconds min,
                         std::chrono::nanoseconds max) {
    const double total_us =
        std::chrono::duration<double, std::micro>(total).count();
    const double avg_us = total_us / iters;
    const double min_us =
        std::chrono::duration<double, std::micro>(min).count();
    const double max_us =
        std::chrono::duration<double, std::micro>(max).count();

    std::cout << "\n[ PERF ] " << label << "\n"
              << "        iters=" << iters << " total_us=" << std::fixed
              << std::setprecision(2) << total_us << " avg_us=" << std::fixed
              << std::setprecision(3) << avg_us << " min_us=" << std::fixed
              << std::setprecision(3) << min_us << " max_us=" << std::fixed
              << std::setprecision(3) << max_us << "\n";
}

static void print_ops(const char* label, int seconds, std::uint64_t total_ops,
                      const std::vector<std::uint64_t>& per_sec,
                      const respool::PoolMetrics& m) {
    std::uint64_t peak = 0;
    for (auto v : per_sec) peak = std::max(peak, v);

    const double avg = seconds > 0 ? (double)total_ops / (double)seconds : 0.0;
    const auto waits = m.wait_count.load();
    const double avg_wait_us =
        waits ? (double)m.wait_time_total_us.load() / (double)waits : 0.0;

    std::cout << "\n[ PERF ] " << label << "\n"
              << "        duration_s=" << seconds << " total_ops=" << total_ops
              << " avg_ops=" << std::fixed << std::setprecision(2) << avg
              << " peak_ops=" << peak << "\n"
              << "        waits=" << waits << " avg_wait_us=" << std::fixed
              << std::setprecision(2) << avg_wait_us
              << " max_wait_us=" << m.wait_time_max_us.load()
              << " handed_off=" << m.resource_handed_off.load() << "\n";
}

// Stand-in for an expensive handle: a buffer that takes a while to set up.
struct Scratch {
    std::vector<char> bytes;
    std::size_t used{0};
};

class ScratchFactory : public respool::ResourceFactory<Scratch> {
   public:
    std::unique_ptr<Scratch> create() override {
        auto s = std::make_unique<Scratch>();
        s->bytes.resize(64 * 1024);
        std::this_thread::sleep_for(std::chrono::microseconds(200));
        return s;
    }

    void reset(Scratch& s) override { s.used = 0; }
};

class PoolPerf : public ::testing::Test {
   protected:
    void SetUp() override {
        respool::default_logger()->set_level(spdlog::level::warn);
        cfg_.name = "perf";
        cfg_.max_size = 4;
        cfg_.violation_policy = respool::ViolationPolicy::Lenient;
        factory_ = std::make_shared<ScratchFactory>();
    }

    respool::PoolConfiguration cfg_;
    std::shared_ptr<ScratchFactory> factory_;
};

TEST_F(PoolPerf, WarmUncontendedAcquireRelease) {
    constexpr int iters = 100000;
    respool::Pool<Scratch> pool(factory_, cfg_);

    // Warm-up
    {
        auto r = pool.acquire(std::nullopt);
        ASSERT_TRUE(r.has_value()) << r.error().message;
        ASSERT_TRUE(pool.release(std::move(r).value()));
    }

    using clock = std::chrono::steady_clock;
    std::chrono::nanoseconds total{0};
    std::chrono::nanoseconds min = std::chrono::nanoseconds::max();
    std::chrono::nanoseconds max{0};

    for (int i = 0; i < iters; ++i) {
        const auto t0 = clock::now();
        auto r = pool.acquire(std::nullopt);
        ASSERT_TRUE(r.has_value());
        auto res = pool.release(std::move(r).value());
        const auto t1 = clock::now();
        ASSERT_TRUE(res);

        const auto dt =
            std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0);
        total += dt;
        min = std::min(min, dt);
        max = std::max(max, dt);
    }

    print_result("Warm (reuse idle resource)", iters, total, min, max);
    EXPECT_EQ(pool.stats().total_created, 1u);
}

TEST_F(PoolPerf, ColdNewPoolEachAcquire) {
    constexpr int iters = 500;
    using clock = std::chrono::steady_clock;

    std::chrono::nanoseconds total{0};
    std::chrono::nanoseconds min = std::chrono::nanoseconds::max();
    std::chrono::nanoseconds max{0};

    for (int i = 0; i < iters; ++i) {
        respool::Pool<Scratch> pool(factory_, cfg_);

        const auto t0 = clock::now();
        auto r = pool.acquire(std::nullopt);
        const auto t1 = clock::now();
        ASSERT_TRUE(r.has_value());

        const auto dt =
            std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0);
        total += dt;
        min = std::min(min, dt);
        max = std::max(max, dt);
    }

    print_result("Cold (create on every acquire)", iters, total, min, max);
}

TEST_F(PoolPerf, ContendedThroughput5Seconds) {
    constexpr int seconds = 5;
    constexpr int threads = 16;
    respool::Pool<Scratch> pool(factory_, cfg_);

    using clock = std::chrono::steady_clock;
    const auto start = clock::now();
    const auto deadline = start + std::chrono::seconds(seconds);

    std::vector<std::atomic<std::uint64_t>> buckets(seconds);
    std::atomic<std::uint64_t> total{0};
    std::atomic<std::uint64_t> failures{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&] {
            for (;;) {
                const auto now = clock::now();
                if (now >= deadline) break;

                auto r = pool.acquire(std::nullopt);
                if (!r) {
                    failures.fetch_add(1, std::memory_order_relaxed);
                    continue;
                }
                auto lease = std::move(r).value();
                lease->used = lease->bytes.size();
                if (!pool.release(std::move(lease))) {
                    failures.fetch_add(1, std::memory_order_relaxed);
                    continue;
                }

                const auto sec = std::chrono::duration_cast<std::chrono::seconds>(
                                     clock::now() - start)
                                     .count();
                if (sec < seconds) {
                    buckets[sec].fetch_add(1, std::memory_order_relaxed);
                }
                total.fetch_add(1, std::memory_order_relaxed);
            }
        });
    }
    for (auto& w : workers) w.join();

    std::vector<std::uint64_t> per_sec;
    for (auto& b : buckets) per_sec.push_back(b.load());

    print_ops("Contended (16 threads, max_size=4)", seconds, total.load(),
              per_sec, pool.metrics());
    EXPECT_EQ(failures.load(), 0u);
    EXPECT_LE(pool.stats().total_created, cfg_.max_size);
}
