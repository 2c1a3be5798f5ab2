#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/logger.h>

#include "respool/config.hpp"
#include "respool/error.hpp"
#include "respool/log.hpp"
#include "respool/pool/pool_types.hpp"
#include "respool/resource.hpp"
#include "respool/result.hpp"

namespace respool {

    /**
     * Thread-safe pool of expensive resources of type R.
     *
     * SAFETY:
     * - All public methods are thread-safe and can be called from any thread
     * - Bookkeeping is guarded by a single mutex; factory calls (create,
     *   reset, validate) and resource destruction never run under it
     * - Blocking callers and asio coroutines share one FIFO waiter queue
     *
     * INVARIANTS:
     * 1. available.size() + checked_out_count <= max_size
     * 2. No resource is both idle and owned by a Lease
     * 3. A resource is reset before it becomes visible to the next borrower
     * 4. A freed slot (resource or create permit) goes to the oldest waiter
     * 5. Every waiter is either queued or being removed by its owner
     *
     * ERRORS:
     * - PoolExhausted: no slot within the wait bound, retry may succeed
     * - CreationFailed: factory create() failed, not retried
     * - DoubleReleaseOrUnknownHandle: caller bug, thrown or returned per
     *   ViolationPolicy
     * - Cancelled / Shutdown: the wait was abandoned or the pool closed
     *
     * LIFECYCLE:
     * 1. Construction: Pool is alive, no resources exist yet
     * 2. acquire() creates lazily up to max_size, release() recycles
     * 3. shutdown(): fails waiters, destroys idle resources
     * 4. Destruction: calls shutdown(); outstanding leases destroy their
     *    resource when they go away
     */
    template <typename R>
    class Pool {
        struct Core;

       public:
        using resource_type = R;
        using factory_type = ResourceFactory<R>;
        using clock_type = std::chrono::steady_clock;

        /**
         * @brief Exclusive, move-only ownership of a checked-out resource.
         *
         * Hand it back with Pool::release(std::move(lease)). A lease that is
         * destroyed without being released returns its resource on its own.
         */
        class Lease {
           public:
            Lease() = default;

            Lease(Lease&& other) noexcept { move_from(std::move(other)); }

            Lease& operator=(Lease&& other) noexcept {
                if (this != &other) {
                    return_to_pool();
                    move_from(std::move(other));
                }
                return *this;
            }

            Lease(Lease const&) = delete;
            Lease& operator=(Lease const&) = delete;

            ~Lease() { return_to_pool(); }

            R* operator->() const noexcept { return res_.get(); }

            R& operator*() const { return *res_; }

            /// @brief The borrowed resource, or nullptr once released
            R* get() const noexcept { return res_.get(); }

            explicit operator bool() const noexcept {
                return static_cast<bool>(res_);
            }

            /// @brief Identifier of this checkout, unique within the pool
            std::uint64_t id() const noexcept { return id_; }

            /// @brief Discard the resource on release instead of reusing it
            void mark_bad() noexcept { reusable_ = false; }

           private:
            friend class Pool;
            friend struct Pool::Core;

            Lease(std::weak_ptr<Core> core, std::unique_ptr<R> res,
                  std::uint64_t id) noexcept
                : core_(std::move(core)), res_(std::move(res)), id_(id) {}

            void return_to_pool() noexcept;

            void move_from(Lease&& other) noexcept {
                core_ = std::move(other.core_);
                res_ = std::move(other.res_);
                id_ = std::exchange(other.id_, 0);
                reusable_ = std::exchange(other.reusable_, true);
            }

            std::weak_ptr<Core> core_;
            std::unique_ptr<R> res_;
            std::uint64_t id_{0};
            bool reusable_{true};
        };

        /**
         * @brief Constructs a pool.
         * @param factory Builds, resets and validates resources.
         * @param cfg Pool configuration; max_size is required.
         * @throws std::invalid_argument on a null factory or bad config.
         */
        Pool(std::shared_ptr<factory_type> factory, PoolConfiguration cfg)
            : core_(std::make_shared<Core>(std::move(factory), std::move(cfg))) {
        }

        Pool(const Pool&) = delete;
        Pool& operator=(const Pool&) = delete;

        ~Pool() { core_->shutdown(); }

        /// @brief Acquire with the configured acquire_timeout_default
        Result<Lease> acquire() {
            return acquire(core_->cfg.acquire_timeout_default);
        }

        /**
         * @brief Borrow a resource, blocking while the pool is at capacity.
         * @param timeout Wait bound; std::nullopt waits forever, zero fails
         * immediately with PoolExhausted.
         * @param stop Abandons the wait with Cancelled when stop is requested.
         */
        Result<Lease> acquire(Timeout timeout, std::stop_token stop = {}) {
            auto core = core_;
            return core->acquire(timeout, std::move(stop));
        }

        /// @brief Coroutine flavour of acquire() using the default timeout
        boost::asio::awaitable<Result<Lease>> async_acquire() {
            return Core::async_acquire(core_,
                                       core_->cfg.acquire_timeout_default);
        }

        /**
         * @brief Borrow a resource from a Boost.Asio coroutine.
         * @note Waits on a timer instead of blocking the thread. Destroying
         * the suspended coroutine removes it from the waiter queue.
         */
        boost::asio::awaitable<Result<Lease>> async_acquire(Timeout timeout) {
            return Core::async_acquire(core_, timeout);
        }

        /**
         * @brief Return a resource to the pool.
         * @return ResetFailed / ValidationFailed when user hooks threw (the
         * resource is discarded), DoubleReleaseOrUnknownHandle for leases the
         * pool does not track (Lenient policy; Strict throws).
         */
        Result<void> release(Lease&& lease) { return core_->release(lease); }

        /// @brief Evict idle resources until at most target remain
        std::size_t shrink_idle(std::size_t target) {
            return core_->shrink_idle(target);
        }

        /// @brief Evict idle resources down to the configured idle_target
        std::size_t shrink_idle() {
            return core_->shrink_idle(core_->cfg.idle_target);
        }

        /// @brief Evict resources idle for longer than idle_ttl
        std::size_t reap_idle() { return core_->reap_idle(); }

        /// Shutdown the pool immediately, failing all waiters
        void shutdown() { core_->shutdown(); }

        /// Wait for every checked-out resource to come back
        bool drain(std::chrono::milliseconds timeout) {
            return core_->drain(timeout);
        }

        PoolStats stats() const { return core_->stats(); }

        ///@brief Access metrics for monitoring
        PoolMetrics const& metrics() const noexcept { return core_->metrics; }

        PoolConfiguration const& config() const noexcept { return core_->cfg; }

       private:
        /// @brief State shared with leases, which reference it weakly
        struct Core : std::enable_shared_from_this<Core> {
            using Wakeup = std::function<void()>;

            struct Idle {
                std::unique_ptr<R> res;
                clock_type::time_point since;
            };

            struct Waiter {
                std::unique_ptr<R> granted;  ///< Resource handed over
                bool permit{false};   ///< Slot handed over, caller creates
                bool closed{false};   ///< Pool shut down while waiting
                bool done{false};     ///< No longer eligible for handoff
                std::condition_variable_any cv;  ///< Blocking waiters
                Wakeup notify;                   ///< Coroutine waiters
            };

            using waiter_iterator = typename std::list<Waiter>::iterator;

            enum class Slot { Leased, Reserved, Full, Closed };

            /// @brief Deregisters a coroutine waiter whose frame goes away
            struct WaitGuard {
                WaitGuard(std::shared_ptr<Core> c, waiter_iterator w)
                    : core(std::move(c)), it(w) {}

                WaitGuard(const WaitGuard&) = delete;
                WaitGuard& operator=(const WaitGuard&) = delete;

                ~WaitGuard() {
                    if (core) core->abandon_wait(it);
                }

                void dismiss() noexcept { core.reset(); }

                std::shared_ptr<Core> core;
                waiter_iterator it;
            };

            Core(std::shared_ptr<factory_type> f, PoolConfiguration c)
                : factory(std::move(f)), cfg(std::move(c)) {
                if (!factory) {
                    throw std::invalid_argument("pool '" + cfg.name +
                                                "': factory must not be null");
                }
                validate_configuration(cfg);
                log = cfg.logger ? cfg.logger : default_logger();
                validate_on_release =
                    cfg.validate_on_release.value_or(factory->can_validate());
                log->info(
                    "pool '{}' created (max_size={}, validate_on_release={}, "
                    "violation_policy={})",
                    cfg.name, cfg.max_size, validate_on_release,
                    to_string(cfg.violation_policy));
            }

            // ---------------------------------------------------------------
            // acquire
            // ---------------------------------------------------------------

            Result<Lease> acquire(Timeout timeout, std::stop_token stop) {
                Lease lease;
                std::unique_lock<std::mutex> lk(mu);

                Slot slot = try_acquire_locked(lease);
                if (slot == Slot::Full) {
                    if (timeout && timeout->count() <= 0) {
                        lk.unlock();
                        return exhausted();
                    }
                    if (stop.stop_requested()) {
                        lk.unlock();
                        return cancelled();
                    }

                    const auto started = clock_type::now();
                    auto it = waiters.emplace(waiters.end());
                    metrics.waiters.fetch_add(1, std::memory_order_relaxed);

                    auto granted = [&it] { return it->done; };
                    const auto deadline =
                        timeout ? deadline_for(started, *timeout)
                                : std::nullopt;
                    if (deadline) {
                        it->cv.wait_until(lk, stop, *deadline, granted);
                    } else {
                        it->cv.wait(lk, stop, granted);
                    }

                    slot = finish_wait_locked(it, lease);
                    lk.unlock();

                    if (slot == Slot::Full) {
                        return stop.stop_requested() ? cancelled()
                                                     : exhausted();
                    }
                    if (slot != Slot::Closed) {
                        metrics.record_wait(clock_type::now() - started);
                    }
                } else {
                    lk.unlock();
                }

                return complete(slot, std::move(lease));
            }

            static boost::asio::awaitable<Result<Lease>> async_acquire(
                std::shared_ptr<Core> self, Timeout timeout) {
                Lease lease;
                Slot slot;
                {
                    std::lock_guard<std::mutex> lk(self->mu);
                    slot = self->try_acquire_locked(lease);
                }

                if (slot == Slot::Full) {
                    if (timeout && timeout->count() <= 0) {
                        co_return self->exhausted();
                    }

                    // Timer operations are serialized on a strand: the wakeup
                    // posted by a releasing thread and the wait initiation in
                    // park() never touch the timer concurrently.
                    auto strand = boost::asio::make_strand(
                        co_await boost::asio::this_coro::executor);
                    auto timer =
                        std::make_shared<boost::asio::steady_timer>(strand);
                    const auto deadline =
                        timeout ? deadline_for(clock_type::now(), *timeout)
                                : std::nullopt;
                    timer->expires_at(
                        deadline.value_or(clock_type::time_point::max()));

                    const auto started = clock_type::now();
                    std::optional<WaitGuard> guard;
                    {
                        std::lock_guard<std::mutex> lk(self->mu);
                        // Close lost-wakeup window
                        slot = self->try_acquire_locked(lease);
                        if (slot == Slot::Full) {
                            auto it = self->waiters.emplace(self->waiters.end());
                            it->notify = [strand, timer] {
                                boost::asio::post(strand,
                                                  [timer] { timer->cancel(); });
                            };
                            self->metrics.waiters.fetch_add(
                                1, std::memory_order_relaxed);
                            guard.emplace(self, it);
                        }
                    }

                    if (guard) {
                        const auto ec = co_await boost::asio::co_spawn(
                            strand, park(self, guard->it, timer),
                            boost::asio::use_awaitable);

                        {
                            std::lock_guard<std::mutex> lk(self->mu);
                            slot = self->finish_wait_locked(guard->it, lease);
                            guard->dismiss();
                        }

                        if (slot == Slot::Full) {
                            co_return ec == boost::asio::error::operation_aborted
                                ? self->cancelled()
                                : self->exhausted();
                        }
                        if (slot != Slot::Closed) {
                            self->metrics.record_wait(clock_type::now() -
                                                      started);
                        }
                    }
                }

                co_return self->complete(slot, std::move(lease));
            }

            /// @brief Sleep on the timer until it expires or a wakeup cancels it
            /// @note Runs on the timer's strand
            static boost::asio::awaitable<boost::system::error_code> park(
                std::shared_ptr<Core> self, waiter_iterator it,
                std::shared_ptr<boost::asio::steady_timer> timer) {
                {
                    std::lock_guard<std::mutex> lk(self->mu);
                    if (it->done) {
                        co_return boost::system::error_code(
                            boost::asio::error::operation_aborted);
                    }
                }
                boost::system::error_code ec;
                co_await timer->async_wait(
                    boost::asio::redirect_error(boost::asio::use_awaitable, ec));
                co_return ec;
            }

            /// @brief Absolute deadline of a wait bound
            /// @return std::nullopt when the bound lies past what the clock can
            /// represent, i.e. the wait is unbounded
            static std::optional<clock_type::time_point> deadline_for(
                clock_type::time_point from,
                std::chrono::milliseconds timeout) noexcept {
                const auto room =
                    std::chrono::duration_cast<std::chrono::milliseconds>(
                        clock_type::time_point::max() - from);
                if (timeout >= room) return std::nullopt;
                return from + timeout;
            }

            /// @brief Take an idle resource or reserve a creation slot
            Slot try_acquire_locked(Lease& out) {
                if (!alive) return Slot::Closed;

                // Most recently released first: warm caches
                if (!available.empty()) {
                    auto res = std::move(available.back().res);
                    available.pop_back();
                    ++checked_out_count;
                    out = lease_locked(std::move(res));
                    metrics.resource_reused.fetch_add(
                        1, std::memory_order_relaxed);
                    check_invariants_locked();
                    return Slot::Leased;
                }

                if (available.size() + checked_out_count < cfg.max_size) {
                    ++checked_out_count;
                    check_invariants_locked();
                    return Slot::Reserved;
                }
                return Slot::Full;
            }

            /// @brief Collect the outcome of a wait and leave the queue
            Slot finish_wait_locked(waiter_iterator it, Lease& out) {
                Slot slot = Slot::Full;
                if (it->granted) {
                    out = lease_locked(std::move(it->granted));
                    slot = Slot::Leased;
                } else if (it->permit) {
                    slot = Slot::Reserved;
                } else if (it->closed) {
                    slot = Slot::Closed;
                }
                waiters.erase(it);
                metrics.waiters.fetch_sub(1, std::memory_order_relaxed);
                return slot;
            }

            /// @brief Pass on whatever a vanished waiter had been handed
            void abandon_wait(waiter_iterator it) noexcept {
                std::unique_ptr<R> doomed;
                Wakeup wake;
                {
                    std::lock_guard<std::mutex> lk(mu);
                    if (it->granted) {
                        --checked_out_count;
                        doomed = std::move(it->granted);
                        wake = put_back_locked(doomed);
                    } else if (it->permit) {
                        --checked_out_count;
                        wake = hand_slot_locked();
                    }
                    waiters.erase(it);
                    metrics.waiters.fetch_sub(1, std::memory_order_relaxed);
                    notify_drained_locked();
                    check_invariants_locked();
                }
                doomed.reset();
                if (wake) wake();
            }

            Result<Lease> complete(Slot slot, Lease lease) {
                switch (slot) {
                    case Slot::Leased:
                        metrics.acquire_success.fetch_add(
                            1, std::memory_order_relaxed);
                        return Result<Lease>::ok(std::move(lease));
                    case Slot::Reserved:
                        return create_reserved();
                    case Slot::Closed:
                        return closed();
                    case Slot::Full:
                        break;
                }
                return exhausted();
            }

            /// @brief Build a resource for a slot that is already counted
            Result<Lease> create_reserved() {
                std::unique_ptr<R> res;
                std::exception_ptr failure;
                try {
                    res = factory->create();
                } catch (...) {
                    failure = std::current_exception();
                }

                if (!res) {
                    std::string why = failure ? describe(failure)
                                              : "factory returned no resource";
                    Wakeup wake;
                    {
                        std::lock_guard<std::mutex> lk(mu);
                        --checked_out_count;
                        wake = hand_slot_locked();
                        notify_drained_locked();
                        check_invariants_locked();
                    }
                    if (wake) wake();

                    metrics.acquire_creation_failed.fetch_add(
                        1, std::memory_order_relaxed);
                    log->warn("pool '{}': resource creation failed: {}",
                              cfg.name, why);
                    return Result<Lease>::err(Error{Error::Code::CreationFailed,
                                                    std::move(why), failure});
                }

                Lease lease;
                std::uint64_t created = 0;
                {
                    std::lock_guard<std::mutex> lk(mu);
                    created = ++total_created;
                    lease = lease_locked(std::move(res));
                }
                metrics.resource_created.fetch_add(1, std::memory_order_relaxed);
                metrics.acquire_success.fetch_add(1, std::memory_order_relaxed);
                log->debug("pool '{}': created resource {} for lease #{}",
                           cfg.name, created, lease.id());
                return Result<Lease>::ok(std::move(lease));
            }

            Lease lease_locked(std::unique_ptr<R> res) {
                const auto id = next_id++;
                checked_out.emplace(id, res.get());
                return Lease(this->weak_from_this(), std::move(res), id);
            }

            // ---------------------------------------------------------------
            // release
            // ---------------------------------------------------------------

            Result<void> release(Lease& lease) {
                if (!lease.res_) {
                    return violation(
                        "release of an empty or already released lease");
                }
                if (lease.core_.lock().get() != this) {
                    return violation("lease #" + std::to_string(lease.id_) +
                                     " belongs to another pool");
                }

                bool tracked = false;
                {
                    std::lock_guard<std::mutex> lk(mu);
                    auto it = checked_out.find(lease.id_);
                    if (it != checked_out.end() &&
                        it->second == lease.res_.get()) {
                        checked_out.erase(it);
                        tracked = true;
                    }
                }
                if (!tracked) {
                    return violation("lease #" + std::to_string(lease.id_) +
                                     " is not checked out");
                }

                const auto id = std::exchange(lease.id_, 0);
                const bool reusable = std::exchange(lease.reusable_, true);
                auto res = std::move(lease.res_);
                lease.core_.reset();
                return recycle(std::move(res), reusable, id);
            }

            /// @brief Reset, validate and re-home a returned resource
            Result<void> recycle(std::unique_ptr<R> res, bool keep,
                                 std::uint64_t id) {
                std::optional<Error> failure;

                if (!keep) {
                    metrics.resource_discarded_bad.fetch_add(
                        1, std::memory_order_relaxed);
                    log->debug("pool '{}': lease #{} marked bad, discarding",
                               cfg.name, id);
                }

                if (keep) {
                    try {
                        factory->reset(*res);
                    } catch (...) {
                        keep = false;
                        auto ep = std::current_exception();
                        failure = Error{Error::Code::ResetFailed, describe(ep),
                                        ep};
                        metrics.reset_failed.fetch_add(
                            1, std::memory_order_relaxed);
                        log->error(
                            "pool '{}': reset of lease #{} threw: {}, "
                            "discarding",
                            cfg.name, id, failure->message);
                    }
                }

                if (keep && validate_on_release) {
                    try {
                        keep = factory->validate(*res);
                    } catch (...) {
                        keep = false;
                        auto ep = std::current_exception();
                        failure = Error{Error::Code::ValidationFailed,
                                        describe(ep), ep};
                        log->error(
                            "pool '{}': validation of lease #{} threw: {}",
                            cfg.name, id, failure->message);
                    }
                    if (!keep) {
                        metrics.resource_discarded_invalid.fetch_add(
                            1, std::memory_order_relaxed);
                        log->debug(
                            "pool '{}': lease #{} failed validation, "
                            "discarding",
                            cfg.name, id);
                    }
                }

                Wakeup wake;
                {
                    std::lock_guard<std::mutex> lk(mu);
                    --checked_out_count;
                    if (keep) {
                        wake = put_back_locked(res);
                    } else {
                        wake = hand_slot_locked();
                    }
                    notify_drained_locked();
                    check_invariants_locked();
                }
                res.reset();
                if (wake) wake();

                if (failure) return Result<void>::err(std::move(*failure));
                return Result<void>::ok();
            }

            Result<void> violation(std::string what) {
                metrics.release_invalid_handle.fetch_add(
                    1, std::memory_order_relaxed);
                std::string message = "pool '" + cfg.name + "': " + what;
                if (cfg.violation_policy == ViolationPolicy::Strict) {
                    log->critical("{}", message);
                    throw ContractViolation(message);
                }
                log->error("{} (ignored)", message);
                return Result<void>::err(Error{
                    Error::Code::DoubleReleaseOrUnknownHandle, std::move(message)});
            }

            /// @brief Hand a clean resource to the oldest waiter or park it
            /// @note Leaves res untouched when the pool is closed
            Wakeup put_back_locked(std::unique_ptr<R>& res) {
                if (!alive) return {};

                if (Waiter* w = next_waiter_locked()) {
                    w->granted = std::move(res);
                    ++checked_out_count;
                    metrics.resource_handed_off.fetch_add(
                        1, std::memory_order_relaxed);
                    return signal_locked(*w);
                }
                available.push_back(Idle{std::move(res), clock_type::now()});
                return {};
            }

            /// @brief Give a freed slot to the oldest waiter as a create permit
            Wakeup hand_slot_locked() {
                if (!alive) return {};

                Waiter* w = next_waiter_locked();
                if (!w) return {};
                w->permit = true;
                ++checked_out_count;
                return signal_locked(*w);
            }

            Waiter* next_waiter_locked() {
                for (auto& w : waiters) {
                    if (!w.done) return &w;
                }
                return nullptr;
            }

            /// @brief Blocking waiters are notified under the lock, coroutine
            /// waiters by the returned callback once it is released
            Wakeup signal_locked(Waiter& w) {
                w.done = true;
                if (w.notify) return w.notify;
                w.cv.notify_one();
                return {};
            }

            void notify_drained_locked() {
                if (checked_out_count == 0) drained.notify_all();
            }

            // ---------------------------------------------------------------
            // maintenance
            // ---------------------------------------------------------------

            std::size_t shrink_idle(std::size_t target) {
                std::vector<std::unique_ptr<R>> doomed;
                {
                    std::lock_guard<std::mutex> lk(mu);
                    while (available.size() > target) {
                        doomed.push_back(std::move(available.front().res));
                        available.pop_front();
                    }
                }
                return evicted(doomed, "shrink");
            }

            std::size_t reap_idle() {
                if (cfg.idle_ttl.count() <= 0) return 0;

                std::vector<std::unique_ptr<R>> doomed;
                {
                    std::lock_guard<std::mutex> lk(mu);
                    const auto now = clock_type::now();
                    while (available.size() > cfg.idle_target &&
                           now - available.front().since >= cfg.idle_ttl) {
                        doomed.push_back(std::move(available.front().res));
                        available.pop_front();
                    }
                }
                return evicted(doomed, "reap");
            }

            std::size_t evicted(std::vector<std::unique_ptr<R>>& doomed,
                                const char* reason) {
                const auto n = doomed.size();
                doomed.clear();
                if (n > 0) {
                    metrics.resource_evicted_idle.fetch_add(
                        n, std::memory_order_relaxed);
                    log->debug("pool '{}': {} evicted {} idle resource(s)",
                               cfg.name, reason, n);
                }
                return n;
            }

            void shutdown() {
                std::deque<Idle> idle;
                std::vector<Wakeup> wakes;
                std::size_t failed_waiters = 0;
                {
                    std::lock_guard<std::mutex> lk(mu);
                    if (!alive) return;
                    alive = false;
                    idle.swap(available);

                    for (auto& w : waiters) {
                        if (w.done) continue;
                        w.closed = true;
                        ++failed_waiters;
                        if (auto wake = signal_locked(w)) {
                            wakes.push_back(std::move(wake));
                        }
                    }
                }

                for (auto& wake : wakes) wake();
                log->info(
                    "pool '{}' shut down ({} idle released, {} waiter(s) "
                    "failed)",
                    cfg.name, idle.size(), failed_waiters);
            }

            bool drain(std::chrono::milliseconds timeout) {
                std::unique_lock<std::mutex> lk(mu);
                return drained.wait_for(lk, timeout,
                                        [this] { return checked_out_count == 0; });
            }

            PoolStats stats() const {
                std::lock_guard<std::mutex> lk(mu);
                PoolStats out{};
                out.available = available.size();
                out.checked_out = checked_out_count;
                out.waiting = 0;
                for (auto const& w : waiters) {
                    if (!w.done) ++out.waiting;
                }
                out.total_created = total_created;
                out.max_size = cfg.max_size;
                return out;
            }

            // ---------------------------------------------------------------
            // errors
            // ---------------------------------------------------------------

            Result<Lease> exhausted() {
                metrics.acquire_exhausted.fetch_add(1, std::memory_order_relaxed);
                return Result<Lease>::err(
                    Error{Error::Code::PoolExhausted,
                          "pool '" + cfg.name + "' exhausted (max_size=" +
                              std::to_string(cfg.max_size) + ")"});
            }

            Result<Lease> cancelled() {
                metrics.acquire_cancelled.fetch_add(1, std::memory_order_relaxed);
                return Result<Lease>::err(
                    Error{Error::Code::Cancelled,
                          "acquire on pool '" + cfg.name + "' was cancelled"});
            }

            Result<Lease> closed() {
                metrics.acquire_shutdown.fetch_add(1, std::memory_order_relaxed);
                return Result<Lease>::err(Error{
                    Error::Code::Shutdown, "pool '" + cfg.name + "' is shut down"});
            }

            /// @brief Check internal invariants, only in debug builds
            void check_invariants_locked() const {
#ifndef NDEBUG
                assert(available.size() + checked_out_count <= cfg.max_size &&
                       "live resources exceed max_size");
                assert(checked_out.size() <= checked_out_count &&
                       "checked_out map drift");
                for (auto const& idle : available) {
                    assert(idle.res && "idle resource is null");
                    for (auto const& [id, ptr] : checked_out) {
                        (void)id;
                        assert(ptr != idle.res.get() &&
                               "resource both idle and leased");
                    }
                }
#endif
            }

            std::shared_ptr<factory_type> factory;
            PoolConfiguration cfg;
            std::shared_ptr<spdlog::logger> log;
            bool validate_on_release{false};

            mutable std::mutex mu;  ///< Guards everything below
            std::condition_variable drained;
            std::deque<Idle> available;  ///< Oldest at front
            std::unordered_map<std::uint64_t, R const*> checked_out;
            std::size_t checked_out_count{0};  ///< Leased, reserved, returning
            std::uint64_t total_created{0};
            std::list<Waiter> waiters;  ///< FIFO, stable iterators
            std::uint64_t next_id{1};
            bool alive{true};

            PoolMetrics metrics;
        };

        std::shared_ptr<Core> core_;
    };

    template <typename R>
    void Pool<R>::Lease::return_to_pool() noexcept {
        if (!res_) return;

        auto core = core_.lock();
        if (!core) {
            // Pool already gone; the resource dies with the lease.
            res_.reset();
            id_ = 0;
            return;
        }

        try {
            auto result = core->release(*this);
            if (result.has_error()) {
                core->log->warn("pool '{}': implicit release: {}",
                                core->cfg.name, result.error().message);
            }
        } catch (const std::exception& e) {
            core->log->error("pool '{}': implicit release failed: {}",
                             core->cfg.name, e.what());
        }
        res_.reset();
        core_.reset();
        id_ = 0;
    }

}  // namespace respool
