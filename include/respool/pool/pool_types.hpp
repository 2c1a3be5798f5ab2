#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace respool {

    /// @brief Point-in-time view of a pool's bookkeeping
    struct PoolStats {
        std::size_t available = 0;      ///< Idle, ready for reuse
        std::size_t checked_out = 0;    ///< Lent out, reserved or returning
        std::size_t waiting = 0;        ///< Callers blocked in acquire
        std::uint64_t total_created = 0;  ///< Lifetime constructions
        std::size_t max_size = 0;       ///< Configured capacity

        std::size_t live() const noexcept { return available + checked_out; }
    };

    /// @brief Metrics for monitoring pool behavior
    struct PoolMetrics {
        // Gauges (current state)
        std::atomic<std::size_t> waiters{0};  ///< Currently waiting

        // Counters (cumulative)
        std::atomic<std::uint64_t> acquire_success{0};    ///< Successful
        std::atomic<std::uint64_t> acquire_exhausted{0};  ///< PoolExhausted
        std::atomic<std::uint64_t> acquire_cancelled{0};  ///< Cancelled
        std::atomic<std::uint64_t> acquire_shutdown{0};   ///< Pool shut down
        std::atomic<std::uint64_t> acquire_creation_failed{
            0};  ///< Factory create() failed
        std::atomic<std::uint64_t> resource_created{0};  ///< New resources
        std::atomic<std::uint64_t> resource_reused{0};   ///< Reused idle
        std::atomic<std::uint64_t> resource_handed_off{
            0};  ///< Passed straight from release to a waiter
        std::atomic<std::uint64_t> resource_discarded_invalid{
            0};  ///< Failed validation on release
        std::atomic<std::uint64_t> resource_discarded_bad{
            0};  ///< Marked bad by the borrower
        std::atomic<std::uint64_t> resource_evicted_idle{
            0};  ///< Removed by shrink_idle() or reap_idle()
        std::atomic<std::uint64_t> reset_failed{0};  ///< reset() threw
        std::atomic<std::uint64_t> release_invalid_handle{
            0};  ///< Release of an untracked lease

        // Wait statistics (callers that had to queue)
        std::atomic<std::uint64_t> wait_count{0};
        std::atomic<std::uint64_t> wait_time_total_us{0};
        std::atomic<std::uint64_t> wait_time_max_us{0};

        void record_wait(std::chrono::steady_clock::duration waited) noexcept {
            const auto us = static_cast<std::uint64_t>(
                std::chrono::duration_cast<std::chrono::microseconds>(waited)
                    .count());
            wait_count.fetch_add(1, std::memory_order_relaxed);
            wait_time_total_us.fetch_add(us, std::memory_order_relaxed);

            auto prev = wait_time_max_us.load(std::memory_order_relaxed);
            while (prev < us && !wait_time_max_us.compare_exchange_weak(
                                    prev, us, std::memory_order_relaxed)) {
            }
        }
    };

}  // namespace respool
