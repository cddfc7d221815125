#pragma once

#include "database_config.hpp"
#include "database_connection.hpp"
#include "database_error.hpp"
#include "database_link.hpp"
#include "database_pq_link.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace tessera {

    // RAII connection handle from pool. The connection goes back to the pool
    // (or is discarded) when the handle is destroyed or released.
    class pooled_connection {
    public:
        using returner = std::function<void(std::unique_ptr<database_connection>)>;

        pooled_connection() = default;

        pooled_connection(std::unique_ptr<database_connection> conn, returner give_back)
            : conn_(std::move(conn)), returner_(std::move(give_back)) {}

        ~pooled_connection() {
            release();
        }

        // Disable copy, enable move
        pooled_connection(const pooled_connection&) = delete;
        pooled_connection& operator=(const pooled_connection&) = delete;

        pooled_connection(pooled_connection&& other) noexcept
            : conn_(std::move(other.conn_)),
              returner_(std::move(other.returner_)) {}

        pooled_connection& operator=(pooled_connection&& other) noexcept {
            if (this != &other) {
                release();
                conn_ = std::move(other.conn_);
                returner_ = std::move(other.returner_);
            }
            return *this;
        }

        database_connection* operator->() { return checked(); }
        const database_connection* operator->() const { return checked(); }
        database_connection& operator*() { return *checked(); }
        const database_connection& operator*() const { return *checked(); }

        [[nodiscard]] bool valid() const noexcept { return conn_ != nullptr; }
        explicit operator bool() const noexcept { return valid(); }

        // Check if connection is healthy
        [[nodiscard]] bool is_healthy() const noexcept {
            return conn_ && conn_->is_healthy();
        }

        // Hand the connection back early; the handle becomes empty
        void release() noexcept {
            if (conn_ && returner_) {
                auto give_back = std::move(returner_);
                returner_ = nullptr;
                give_back(std::move(conn_));
            }
            conn_.reset();
        }

    private:
        database_connection* checked() const {
            if (!conn_) {
                throw illegal_state_error{"No database connection held by this handle"};
            }
            return conn_.get();
        }

        std::unique_ptr<database_connection> conn_;
        returner returner_;
    };

    struct pool_config {
        connection_config connection;
        std::size_t min_connections = 2;
        std::size_t max_connections = 10;
        // Used when acquire() is given no timeout
        std::chrono::milliseconds acquire_timeout{5000};
        bool validate_on_acquire = true;
        // Statements a connection may run before it is replaced; 0 means no limit
        std::uint64_t max_queries = 50000;
        // Idle connections older than this are closed by maintain(); zero disables
        std::chrono::seconds max_inactive_lifetime{300};
        std::chrono::milliseconds shutdown_grace{10000};
        // Applied to every pooled connection as its default statement timeout
        std::optional<std::chrono::milliseconds> statement_timeout;
        link_factory open_link = &pq_link::open;
    };

    // Get pool statistics
    struct pool_stats {
        std::size_t active_connections;
        std::size_t available_connections;
        std::size_t total_connections;
        std::size_t max_connections;
        std::size_t waiting;
        // Lifetime counters. Once drained, acquired == released + discarded.
        std::uint64_t acquired;
        std::uint64_t released;
        std::uint64_t discarded;
        std::uint64_t evicted;
        std::uint64_t created;
    };

    namespace detail {

        // A caller queued for a connection. Exactly one of the outcomes is set
        // by whoever serves it, under the pool mutex.
        struct pool_waiter {
            std::unique_ptr<database_connection> handed;
            bool may_create = false;
            bool failed = false;
            std::function<void()> wake;

            [[nodiscard]] bool ready() const noexcept {
                return handed || may_create || failed;
            }
        };

        enum class grant {
            none,
            connection,
            create
        };

        // Pool bookkeeping shared with every outstanding lease, so a lease may
        // outlive the pool object itself
        class pool_core : public std::enable_shared_from_this<pool_core> {
        public:
            explicit pool_core(pool_config config) : config(std::move(config)) {}

            struct idle_entry {
                std::unique_ptr<database_connection> conn;
                std::chrono::steady_clock::time_point since;
            };

            const pool_config config;
            std::mutex mutex;
            std::condition_variable_any cv;
            std::deque<idle_entry> idle;
            // Connections lent out, handed to waiters, or being created
            std::size_t lent = 0;
            std::deque<std::shared_ptr<pool_waiter>> waiters;
            std::unordered_set<database_connection*> outstanding;
            bool closed = false;

            std::uint64_t acquired = 0;
            std::uint64_t released = 0;
            std::uint64_t discarded = 0;
            std::uint64_t evicted = 0;
            std::uint64_t created = 0;

            std::unique_ptr<database_connection> make_connection() const {
                auto link = config.open_link(config.connection);
                auto conn = std::make_unique<database_connection>(std::move(link));
                conn->set_default_timeout(config.statement_timeout);
                return conn;
            }

            // Idle connection first, else a creation slot while under max
            grant try_grant_locked(std::unique_ptr<database_connection>& out) {
                while (!idle.empty()) {
                    auto entry = std::move(idle.back());
                    idle.pop_back();
                    if (config.validate_on_acquire && !entry.conn->is_healthy()) {
                        ++evicted;
                        continue;
                    }
                    ++lent;
                    out = std::move(entry.conn);
                    return grant::connection;
                }
                if (idle.size() + lent < config.max_connections) {
                    ++lent;
                    return grant::create;
                }
                return grant::none;
            }

            // Fill a reserved slot; the slot is given up again if creation fails
            std::unique_ptr<database_connection> create_reserved() {
                std::unique_ptr<database_connection> conn;
                try {
                    conn = make_connection();
                } catch (...) {
                    std::lock_guard lock(mutex);
                    --lent;
                    offer_slot_locked();
                    throw;
                }

                std::lock_guard lock(mutex);
                ++created;
                if (closed) {
                    --lent;
                    cv.notify_all();
                    throw pool_closed_error{"Pool was shut down while connecting"};
                }
                return conn;
            }

            pooled_connection lend_locked(std::unique_ptr<database_connection> conn) {
                outstanding.insert(conn.get());
                ++acquired;
                return pooled_connection(std::move(conn),
                    [self = shared_from_this()](std::unique_ptr<database_connection> c) {
                        self->give_back(std::move(c));
                    });
            }

            // Oldest waiter first; idle only when nobody waits
            void deliver_locked(std::unique_ptr<database_connection> conn) {
                if (!waiters.empty()) {
                    auto w = std::move(waiters.front());
                    waiters.pop_front();
                    ++lent;
                    w->handed = std::move(conn);
                    notify(*w);
                    return;
                }
                idle.push_back(idle_entry{std::move(conn), std::chrono::steady_clock::now()});
            }

            // Freed capacity goes to the oldest waiters as creation slots
            void offer_slot_locked() {
                while (!waiters.empty() && idle.size() + lent < config.max_connections) {
                    auto w = std::move(waiters.front());
                    waiters.pop_front();
                    ++lent;
                    w->may_create = true;
                    notify(*w);
                }
            }

            // Remove a waiter that gave up, passing on whatever it was handed
            void abandon_locked(const std::shared_ptr<pool_waiter>& w) {
                auto it = std::find(waiters.begin(), waiters.end(), w);
                if (it != waiters.end()) {
                    waiters.erase(it);
                }
                if (w->handed) {
                    --lent;
                    deliver_locked(std::move(w->handed));
                }
                if (w->may_create) {
                    w->may_create = false;
                    --lent;
                    offer_slot_locked();
                }
            }

            // A connection handed over just before shutdown is not lent out
            std::unique_ptr<database_connection> refuse_handed_locked(pool_waiter& w) {
                --lent;
                ++evicted;
                cv.notify_all();
                return std::move(w.handed);
            }

            void give_back(std::unique_ptr<database_connection> conn) noexcept {
                bool reusable = false;
                {
                    std::lock_guard lock(mutex);
                    reusable = !closed;
                }
                reusable = reusable && conn->prepare_for_reuse() &&
                           (config.max_queries == 0 || conn->statement_count() < config.max_queries);

                std::unique_ptr<database_connection> doomed;
                {
                    std::lock_guard lock(mutex);
                    outstanding.erase(conn.get());
                    --lent;
                    if (closed || !reusable) {
                        ++discarded;
                        doomed = std::move(conn);
                        offer_slot_locked();
                    } else {
                        ++released;
                        deliver_locked(std::move(conn));
                    }
                    cv.notify_all();
                }
            }

            void notify(pool_waiter& w) {
                cv.notify_all();
                if (w.wake) {
                    w.wake();
                }
            }
        };

        // Abandons the waiter if the waiting coroutine is destroyed mid-wait
        struct waiter_guard {
            std::shared_ptr<pool_core> core;
            std::shared_ptr<pool_waiter> waiter;
            bool done = false;

            ~waiter_guard() {
                if (!done) {
                    std::lock_guard lock(core->mutex);
                    core->abandon_locked(waiter);
                }
            }
        };

    } // namespace detail

    // Thread-safe connection pool with FIFO waiters
    class database_pool {
    public:
        using pool_config = tessera::pool_config;
        using pool_stats = tessera::pool_stats;

        explicit database_pool(pool_config config)
            : core_(std::make_shared<detail::pool_core>(validated(std::move(config)))) {

            // Create minimum connections
            for (std::size_t i = 0; i < core_->config.min_connections; ++i) {
                try {
                    auto conn = core_->make_connection();
                    std::lock_guard lock(core_->mutex);
                    ++core_->created;
                    core_->idle.push_back({std::move(conn), std::chrono::steady_clock::now()});
                } catch (const database_error&) {
                    // Clean up and rethrow
                    shutdown(std::chrono::milliseconds{0});
                    throw;
                }
            }
        }

        // Build a pool from a postgres:// URL; other settings come from options
        [[nodiscard]] static std::unique_ptr<database_pool> from_connection_string(
            std::string_view url, pool_config options = {}) {
            options.connection = connection_config::parse(url);
            return std::make_unique<database_pool>(std::move(options));
        }

        ~database_pool() {
            shutdown(std::chrono::milliseconds{0});
        }

        // Disable copy and move
        database_pool(const database_pool&) = delete;
        database_pool& operator=(const database_pool&) = delete;
        database_pool(database_pool&&) = delete;
        database_pool& operator=(database_pool&&) = delete;

        // Acquire connection from pool, waiting in FIFO order when none is free
        [[nodiscard]] pooled_connection acquire(std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                                                std::stop_token stop = {}) {
            auto& core = *core_;
            const auto until = std::chrono::steady_clock::now() + timeout.value_or(core.config.acquire_timeout);
            // Closed outside the pool lock
            std::unique_ptr<database_connection> refused;

            {
                std::unique_lock lock(core.mutex);
                if (core.closed) {
                    throw pool_closed_error{"Pool is shut down"};
                }
                if (stop.stop_requested()) {
                    throw operation_cancelled_error{"Acquire cancelled"};
                }

                std::unique_ptr<database_connection> conn;
                // Newcomers never overtake queued waiters
                const auto g = core.waiters.empty() ? core.try_grant_locked(conn) : detail::grant::none;
                if (g == detail::grant::connection) {
                    return core.lend_locked(std::move(conn));
                }

                if (g == detail::grant::none) {
                    auto w = std::make_shared<detail::pool_waiter>();
                    core.waiters.push_back(w);
                    const bool ready = core.cv.wait_until(lock, stop, until, [&] { return w->ready(); });
                    if (!ready) {
                        core.abandon_locked(w);
                        if (stop.stop_requested()) {
                            throw operation_cancelled_error{"Acquire cancelled"};
                        }
                        throw timeout_error{"Timeout waiting for connection"};
                    }
                    if (w->failed) {
                        throw pool_closed_error{"Pool was shut down while waiting"};
                    }
                    if (w->handed) {
                        if (core.closed) {
                            refused = core.refuse_handed_locked(*w);
                            throw pool_closed_error{"Pool was shut down while waiting"};
                        }
                        return core.lend_locked(std::move(w->handed));
                    }
                    w->may_create = false;
                }
            }

            auto conn = core.create_reserved();
            std::lock_guard lock(core.mutex);
            return core.lend_locked(std::move(conn));
        }

        // Coroutine form of acquire; the wait suspends instead of blocking.
        // Waiters are woken through their executor, which must not run the
        // coroutine on several threads at once.
        [[nodiscard]] net::awaitable<pooled_connection> async_acquire(
            std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
            auto core = core_;
            auto executor = co_await net::this_coro::executor;
            const auto until = std::chrono::steady_clock::now() + timeout.value_or(core->config.acquire_timeout);

            std::unique_ptr<database_connection> conn;
            std::shared_ptr<detail::pool_waiter> w;
            auto timer = std::make_shared<net::steady_timer>(executor, until);
            detail::grant g = detail::grant::none;
            {
                std::lock_guard lock(core->mutex);
                if (core->closed) {
                    throw pool_closed_error{"Pool is shut down"};
                }
                if (core->waiters.empty()) {
                    g = core->try_grant_locked(conn);
                }
                if (g == detail::grant::none) {
                    w = std::make_shared<detail::pool_waiter>();
                    w->wake = [timer] {
                        net::post(timer->get_executor(), [timer] {
                            timer->expires_at(std::chrono::steady_clock::time_point::min());
                        });
                    };
                    core->waiters.push_back(w);
                }
            }

            if (w) {
                detail::waiter_guard guard{core, w};
                while (true) {
                    boost::system::error_code ec;
                    co_await timer->async_wait(net::redirect_error(net::use_awaitable, ec));

                    std::unique_ptr<database_connection> refused;
                    std::lock_guard lock(core->mutex);
                    if (w->ready()) {
                        guard.done = true;
                        if (w->failed) {
                            throw pool_closed_error{"Pool was shut down while waiting"};
                        }
                        if (w->handed && core->closed) {
                            refused = core->refuse_handed_locked(*w);
                            throw pool_closed_error{"Pool was shut down while waiting"};
                        }
                        if (w->handed) {
                            conn = std::move(w->handed);
                            g = detail::grant::connection;
                        } else {
                            w->may_create = false;
                            g = detail::grant::create;
                        }
                        break;
                    }
                    if (std::chrono::steady_clock::now() >= until) {
                        guard.done = true;
                        core->abandon_locked(w);
                        throw timeout_error{"Timeout waiting for connection"};
                    }
                }
            }

            if (g == detail::grant::create) {
                conn = core->create_reserved();
            }
            std::lock_guard lock(core->mutex);
            co_return core->lend_locked(std::move(conn));
        }

        [[nodiscard]] pool_stats get_stats() const {
            std::lock_guard lock(core_->mutex);
            return pool_stats{
                .active_connections = core_->outstanding.size(),
                .available_connections = core_->idle.size(),
                .total_connections = core_->lent + core_->idle.size(),
                .max_connections = core_->config.max_connections,
                .waiting = core_->waiters.size(),
                .acquired = core_->acquired,
                .released = core_->released,
                .discarded = core_->discarded,
                .evicted = core_->evicted,
                .created = core_->created
            };
        }

        // Refuse new acquisitions, fail waiters, close idle connections, then
        // give outstanding leases up to grace before cancelling their statements.
        // Leases returned after shutdown are closed. Safe to call repeatedly.
        void shutdown(std::optional<std::chrono::milliseconds> grace = std::nullopt) {
            auto& core = *core_;
            std::deque<detail::pool_core::idle_entry> doomed;
            {
                std::lock_guard lock(core.mutex);
                core.closed = true;
                for (auto& w : core.waiters) {
                    w->failed = true;
                    core.notify(*w);
                }
                core.waiters.clear();
                doomed.swap(core.idle);
            }
            doomed.clear();

            std::unique_lock lock(core.mutex);
            const auto until = std::chrono::steady_clock::now() + grace.value_or(core.config.shutdown_grace);
            if (!core.cv.wait_until(lock, until, [&] { return core.lent == 0; })) {
                for (auto* conn : core.outstanding) {
                    conn->cancel();
                }
            }
        }

        [[nodiscard]] bool is_shutdown() const {
            std::lock_guard lock(core_->mutex);
            return core_->closed;
        }

        // Perform health check and cleanup of stale connections, then
        // replenish to min_connections. Returns number of connections removed.
        std::size_t maintain() {
            auto& core = *core_;
            std::vector<std::unique_ptr<database_connection>> doomed;
            std::size_t reserved = 0;
            {
                std::lock_guard lock(core.mutex);
                if (core.closed) return 0;

                const auto now = std::chrono::steady_clock::now();
                const auto lifetime = core.config.max_inactive_lifetime;
                std::deque<detail::pool_core::idle_entry> keep;
                // Oldest first, so the longest idle go before min_connections is reached
                while (!core.idle.empty()) {
                    auto entry = std::move(core.idle.front());
                    core.idle.pop_front();
                    const std::size_t total = keep.size() + core.idle.size() + 1 + core.lent;
                    const bool stale = lifetime.count() > 0 && now - entry.since > lifetime &&
                                       total > core.config.min_connections;
                    if (!entry.conn->is_healthy() || stale) {
                        ++core.evicted;
                        doomed.push_back(std::move(entry.conn));
                    } else {
                        keep.push_back(std::move(entry));
                    }
                }
                core.idle = std::move(keep);
                core.offer_slot_locked();

                const std::size_t total = core.idle.size() + core.lent;
                if (total < core.config.min_connections) {
                    reserved = core.config.min_connections - total;
                    core.lent += reserved;
                }
            }
            const std::size_t removed = doomed.size();
            doomed.clear();

            // Replenish pool to minimum connections
            for (std::size_t i = 0; i < reserved; ++i) {
                try {
                    auto conn = core.make_connection();
                    std::lock_guard lock(core.mutex);
                    --core.lent;
                    ++core.created;
                    if (core.closed) {
                        core.cv.notify_all();
                        continue;
                    }
                    core.deliver_locked(std::move(conn));
                } catch (const std::exception& e) {
                    std::cerr << "[tessera] failed to replenish pool: " << e.what() << '\n';
                    std::lock_guard lock(core.mutex);
                    core.lent -= reserved - i;
                    core.offer_slot_locked();
                    core.cv.notify_all();
                    break;
                }
            }
            return removed;
        }

        [[nodiscard]] const pool_config& config() const noexcept {
            return core_->config;
        }

    private:
        static pool_config validated(pool_config config) {
            if (config.max_connections == 0) {
                throw configuration_error{"max_connections must be at least 1"};
            }
            if (config.min_connections > config.max_connections) {
                throw configuration_error{"min_connections cannot exceed max_connections"};
            }
            if (!config.open_link) {
                throw configuration_error{"pool_config.open_link is empty"};
            }
            return config;
        }

        std::shared_ptr<detail::pool_core> core_;
    };

} // namespace tessera
