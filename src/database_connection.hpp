#pragma once

#include "database_config.hpp"
#include "database_error.hpp"
#include "database_link.hpp"
#include "database_pq_link.hpp"
#include "database_result.hpp"
#include "database_template.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <concepts>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include <boost/asio/awaitable.hpp>

namespace tessera {

    class database_transaction;

    template<Mappable T>
    class database_cursor;

    // Transaction isolation levels
    enum class isolation_level {
        read_uncommitted,
        read_committed,
        repeatable_read,
        serializable
    };

    // Transaction access modes
    enum class access_mode {
        read_write,
        read_only
    };

    // Unset fields fall back to the server defaults
    struct transaction_options {
        std::optional<isolation_level> isolation;
        std::optional<access_mode> mode;
        bool deferrable = false;
    };

    class database_connection;

    using notification_handler = std::function<void(database_connection&, const notification&)>;

    // One session with the server. Runs at most one statement at a time.
    class database_connection {
    public:
        explicit database_connection(std::unique_ptr<wire_link> link,
                                     template_compiler compiler = {})
            : link_(std::move(link)), compiler_(compiler) {
            if (!link_) {
                throw database_error{"database_connection requires a wire link"};
            }
        }

        // Connect with libpq
        [[nodiscard]] static std::unique_ptr<database_connection> open(const connection_config& config) {
            return std::make_unique<database_connection>(pq_link::open(config));
        }

        [[nodiscard]] static std::unique_ptr<database_connection> open(std::string_view url) {
            return open(connection_config::parse(url));
        }

        database_connection(const database_connection&) = delete;
        database_connection& operator=(const database_connection&) = delete;

        ~database_connection() {
            close();
        }

        // Rows mapped to T, in server order
        template<Mappable T>
        [[nodiscard]] std::vector<T> fetch(const sql_template& query,
                                           std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
            return result_mapper::map<T>(run(compiler_.compile(query), timeout));
        }

        template<Mappable T>
        [[nodiscard]] std::optional<T> fetchrow(const sql_template& query,
                                                std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
            return result_mapper::map_single_row<T>(run(compiler_.compile(query), timeout));
        }

        template<WireDecodable T>
        [[nodiscard]] T fetchval(const sql_template& query,
                                 std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
            return result_mapper::map_value<T>(run(compiler_.compile(query), timeout));
        }

        // Returns the number of rows affected
        std::uint64_t execute(const sql_template& statement,
                              std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
            return run(compiler_.compile(statement), timeout).affected_rows();
        }

        [[nodiscard]] result_set query(const sql_template& query,
                                       std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
            return run(compiler_.compile(query), timeout);
        }

        // === ASYNC METHODS ===

        template<Mappable T>
        [[nodiscard]] net::awaitable<std::vector<T>> async_fetch(
            sql_template query, std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
            auto rows = co_await async_run(compiler_.compile(query), timeout);
            co_return result_mapper::map<T>(rows);
        }

        template<Mappable T>
        [[nodiscard]] net::awaitable<std::optional<T>> async_fetchrow(
            sql_template query, std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
            auto rows = co_await async_run(compiler_.compile(query), timeout);
            co_return result_mapper::map_single_row<T>(rows);
        }

        template<WireDecodable T>
        [[nodiscard]] net::awaitable<T> async_fetchval(
            sql_template query, std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
            auto rows = co_await async_run(compiler_.compile(query), timeout);
            co_return result_mapper::map_value<T>(rows);
        }

        [[nodiscard]] net::awaitable<std::uint64_t> async_execute(
            sql_template statement, std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
            auto rows = co_await async_run(compiler_.compile(statement), timeout);
            co_return rows.affected_rows();
        }

        [[nodiscard]] net::awaitable<result_set> async_query(
            sql_template query, std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
            co_return co_await async_run(compiler_.compile(query), timeout);
        }

        // === TRANSACTIONS ===

        // Opens a transaction, or a savepoint when one is already active
        [[nodiscard]] database_transaction transaction();
        [[nodiscard]] database_transaction transaction(const transaction_options& options);

        // Commit when func returns, roll back and rethrow when it throws
        template<typename Func>
        requires std::invocable<Func, database_transaction&>
        auto transaction(Func&& func, const transaction_options& options = {});

        [[nodiscard]] std::size_t transaction_depth() const noexcept {
            return transaction_depth_;
        }

        // === LISTEN / NOTIFY ===

        // Returns an id for remove_listener; the first listener on a channel sends LISTEN
        std::uint64_t add_listener(const std::string& channel, notification_handler handler) {
            if (!handler) {
                throw database_error{"Listener callback is empty"};
            }
            if (!has_listener(channel)) {
                run(compiled_statement{"LISTEN " + pq::quote_identifier(channel), {}}, std::nullopt);
            }
            const auto id = ++last_listener_id_;
            listeners_.push_back(listener{id, channel, std::move(handler)});
            return id;
        }

        void remove_listener(std::uint64_t id) {
            auto it = std::find_if(listeners_.begin(), listeners_.end(),
                                   [id](const listener& l) { return l.id == id; });
            if (it == listeners_.end()) {
                throw illegal_state_error{"No listener with id " + std::to_string(id)};
            }
            const std::string channel = it->channel;
            listeners_.erase(it);
            if (!has_listener(channel)) {
                run(compiled_statement{"UNLISTEN " + pq::quote_identifier(channel), {}}, std::nullopt);
            }
        }

        // Wait up to timeout for notifications and hand them to the matching
        // listeners. Returns the number of callbacks made.
        std::size_t dispatch_notifications(std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
            std::vector<notification> received;
            {
                busy_scope scope(busy_);
                if (link_->wait_readable(deadline_for(timeout))) {
                    received = link_->take_notifications();
                }
            }

            std::size_t delivered = 0;
            for (const auto& n : received) {
                // Handlers may add or remove listeners
                const auto snapshot = listeners_;
                for (const auto& l : snapshot) {
                    if (l.channel == n.channel) {
                        l.handler(*this, n);
                        ++delivered;
                    }
                }
            }
            return delivered;
        }

        [[nodiscard]] std::size_t listener_count() const noexcept {
            return listeners_.size();
        }

        // === STATE ===

        [[nodiscard]] link_state state() const noexcept {
            return link_->state();
        }

        [[nodiscard]] bool is_healthy() const noexcept {
            return link_->state() != link_state::broken;
        }

        [[nodiscard]] bool is_busy() const noexcept {
            return busy_;
        }

        // Statements sent over this connection so far
        [[nodiscard]] std::uint64_t statement_count() const noexcept {
            return statements_;
        }

        // Used when a call passes no timeout
        void set_default_timeout(std::optional<std::chrono::milliseconds> timeout) noexcept {
            default_timeout_ = timeout;
        }

        // Thread-safe; aborts the statement in flight. The connection is not reused afterwards.
        void cancel() noexcept {
            link_->cancel();
        }

        void close() noexcept {
            if (link_) {
                link_->close();
            }
        }

        // Return the session to a clean idle state before it is lent again.
        // False means the connection must be discarded.
        [[nodiscard]] bool prepare_for_reuse() noexcept {
            const auto current = link_->state();
            if (busy_ || current == link_state::broken || current == link_state::busy) {
                return false;
            }
            try {
                if (transaction_depth_ > 0 || current == link_state::in_transaction ||
                    current == link_state::failed_transaction) {
                    transaction_depth_ = 0;
                    run(compiled_statement{"ROLLBACK", {}}, std::nullopt);
                }
                if (!listeners_.empty()) {
                    listeners_.clear();
                    run(compiled_statement{"UNLISTEN *", {}}, std::nullopt);
                }
            } catch (const std::exception& e) {
                std::cerr << "[tessera] connection reset failed: " << e.what() << '\n';
                return false;
            }
            return link_->state() == link_state::idle;
        }

    private:
        friend class database_transaction;
        template<Mappable T>
        friend class database_cursor;

        struct listener {
            std::uint64_t id;
            std::string channel;
            notification_handler handler;
        };

        // Claims the connection for one statement
        class busy_scope {
        public:
            explicit busy_scope(std::atomic<bool>& flag) : flag_(flag) {
                if (flag_.exchange(true)) {
                    throw connection_busy_error{"Connection is already executing a statement"};
                }
            }
            ~busy_scope() { flag_ = false; }

            busy_scope(const busy_scope&) = delete;
            busy_scope& operator=(const busy_scope&) = delete;

        private:
            std::atomic<bool>& flag_;
        };

        [[nodiscard]] std::optional<deadline> deadline_for(std::optional<std::chrono::milliseconds> timeout) const {
            if (!timeout) timeout = default_timeout_;
            if (!timeout) return std::nullopt;
            return std::chrono::steady_clock::now() + *timeout;
        }

        result_set run(const compiled_statement& statement, std::optional<std::chrono::milliseconds> timeout) {
            busy_scope scope(busy_);
            ++statements_;
            return link_->send(statement, deadline_for(timeout));
        }

        net::awaitable<result_set> async_run(compiled_statement statement,
                                             std::optional<std::chrono::milliseconds> timeout) {
            busy_scope scope(busy_);
            ++statements_;
            co_return co_await link_->async_send(std::move(statement), deadline_for(timeout));
        }

        [[nodiscard]] bool has_listener(const std::string& channel) const {
            return std::any_of(listeners_.begin(), listeners_.end(),
                               [&](const listener& l) { return l.channel == channel; });
        }

        std::unique_ptr<wire_link> link_;
        template_compiler compiler_;
        std::atomic<bool> busy_{false};
        std::atomic<std::uint64_t> statements_{0};
        std::optional<std::chrono::milliseconds> default_timeout_;
        std::size_t transaction_depth_ = 0;
        std::uint64_t savepoint_counter_ = 0;
        std::uint64_t cursor_counter_ = 0;
        std::vector<listener> listeners_;
        std::uint64_t last_listener_id_ = 0;
    };

} // namespace tessera

// Transaction definitions for the members declared above
#include "database_transaction.hpp"
