#pragma once

#include "database_connection.hpp"
#include <concepts>
#include <cstddef>
#include <exception>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include <boost/asio/awaitable.hpp>

namespace tessera {

    template<Mappable T>
    class database_cursor;

    enum class transaction_status {
        active,
        committed,
        // Still open on the server; the scope will roll it back
        marked_for_rollback,
        rolled_back
    };

    [[nodiscard]] constexpr std::string_view status_name(transaction_status status) noexcept {
        switch (status) {
            case transaction_status::active: return "active";
            case transaction_status::committed: return "committed";
            case transaction_status::marked_for_rollback: return "marked for rollback";
            case transaction_status::rolled_back: return "rolled back";
        }
        return "unknown";
    }

    // RAII transaction guard. A guard opened while another transaction is
    // active on the same connection is a savepoint inside it.
    // Rolls back on destruction unless committed.
    class database_transaction {
    public:
        explicit database_transaction(database_connection& conn, const transaction_options& options = {})
            : conn_(&conn), level_(conn.transaction_depth_ + 1) {
            auto statement = begin_statement(conn, options, level_, savepoint_);
            conn.run(compiled_statement{std::move(statement), {}}, std::nullopt);
            conn.transaction_depth_ = level_;
        }

        // Async counterpart of the constructor
        [[nodiscard]] static net::awaitable<database_transaction> async_begin(
            database_connection& conn, transaction_options options = {}) {
            const std::size_t level = conn.transaction_depth_ + 1;
            std::string savepoint;
            auto statement = begin_statement(conn, options, level, savepoint);
            co_await conn.async_run(compiled_statement{std::move(statement), {}}, std::nullopt);
            conn.transaction_depth_ = level;
            co_return database_transaction(conn, level, std::move(savepoint));
        }

        ~database_transaction() {
            if (conn_ && is_open()) {
                try {
                    rollback();
                } catch (const std::exception& e) {
                    std::cerr << "[tessera] rollback in destructor failed: " << e.what() << '\n';
                }
            }
        }

        // Disable copy, enable move
        database_transaction(const database_transaction&) = delete;
        database_transaction& operator=(const database_transaction&) = delete;

        database_transaction(database_transaction&& other) noexcept
            : conn_(std::exchange(other.conn_, nullptr)),
              level_(other.level_),
              savepoint_(std::move(other.savepoint_)),
              status_(std::exchange(other.status_, transaction_status::rolled_back)) {}

        database_transaction& operator=(database_transaction&&) = delete;

        void commit() {
            require(transaction_status::active, "commit");
            require_innermost("commit");
            auto statement = finish_statement(true);
            // Terminal before sending: a failed COMMIT is never retried
            status_ = transaction_status::rolled_back;
            conn_->transaction_depth_ = level_ - 1;
            const auto result = conn_->run(compiled_statement{std::move(statement), {}}, std::nullopt);
            check_committed(result);
        }

        void rollback() {
            if (!is_open()) {
                throw illegal_state_error{
                    "Cannot roll back a transaction that is " + std::string(status_name(status_))};
            }
            if (conn_->transaction_depth_ < level_) {
                // Already ended by a connection reset
                status_ = transaction_status::rolled_back;
                return;
            }
            require_innermost("roll back");
            status_ = transaction_status::rolled_back;
            conn_->transaction_depth_ = level_ - 1;
            // A broken link takes the server-side transaction with it
            if (!can_send()) {
                return;
            }
            conn_->run(compiled_statement{finish_statement(false), {}}, std::nullopt);
        }

        [[nodiscard]] net::awaitable<void> async_commit() {
            require(transaction_status::active, "commit");
            require_innermost("commit");
            auto statement = finish_statement(true);
            status_ = transaction_status::rolled_back;
            conn_->transaction_depth_ = level_ - 1;
            const auto result = co_await conn_->async_run(compiled_statement{std::move(statement), {}}, std::nullopt);
            check_committed(result);
        }

        [[nodiscard]] net::awaitable<void> async_rollback() {
            if (!is_open()) {
                throw illegal_state_error{
                    "Cannot roll back a transaction that is " + std::string(status_name(status_))};
            }
            if (conn_->transaction_depth_ < level_) {
                status_ = transaction_status::rolled_back;
                co_return;
            }
            require_innermost("roll back");
            status_ = transaction_status::rolled_back;
            conn_->transaction_depth_ = level_ - 1;
            if (can_send()) {
                co_await conn_->async_run(compiled_statement{finish_statement(false), {}}, std::nullopt);
            }
        }

        // The scope ends in a rollback; no further statements are allowed
        void mark_for_rollback() {
            require(transaction_status::active, "mark for rollback");
            status_ = transaction_status::marked_for_rollback;
        }

        // Normal end of a scope: commit, or roll back when marked
        void complete() {
            if (status_ == transaction_status::active) {
                commit();
            } else if (status_ == transaction_status::marked_for_rollback) {
                rollback();
            }
        }

        [[nodiscard]] net::awaitable<void> async_complete() {
            if (status_ == transaction_status::active) {
                co_await async_commit();
            } else if (status_ == transaction_status::marked_for_rollback) {
                co_await async_rollback();
            }
        }

        // Roll back after the scope failed; rollback errors are logged so the
        // original failure is the one that propagates
        void abort_after_failure() noexcept {
            if (!conn_ || !is_open()) return;
            try {
                rollback();
            } catch (const std::exception& e) {
                std::cerr << "[tessera] rollback after failure failed: " << e.what() << '\n';
            }
        }

        [[nodiscard]] net::awaitable<void> async_abort_after_failure() {
            if (!conn_ || !is_open()) co_return;
            try {
                co_await async_rollback();
            } catch (const std::exception& e) {
                std::cerr << "[tessera] rollback after failure failed: " << e.what() << '\n';
            }
        }

        // === QUERIES ===

        std::uint64_t execute(const sql_template& statement,
                              std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
            require(transaction_status::active, "execute");
            return conn_->execute(statement, timeout);
        }

        [[nodiscard]] result_set query(const sql_template& query,
                                       std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
            require(transaction_status::active, "query");
            return conn_->query(query, timeout);
        }

        template<Mappable T>
        [[nodiscard]] std::vector<T> fetch(const sql_template& query,
                                           std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
            require(transaction_status::active, "fetch");
            return conn_->fetch<T>(query, timeout);
        }

        template<Mappable T>
        [[nodiscard]] std::optional<T> fetchrow(const sql_template& query,
                                                std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
            require(transaction_status::active, "fetchrow");
            return conn_->fetchrow<T>(query, timeout);
        }

        template<WireDecodable T>
        [[nodiscard]] T fetchval(const sql_template& query,
                                 std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
            require(transaction_status::active, "fetchval");
            return conn_->fetchval<T>(query, timeout);
        }

        [[nodiscard]] net::awaitable<std::uint64_t> async_execute(
            sql_template statement, std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
            require(transaction_status::active, "execute");
            co_return co_await conn_->async_execute(std::move(statement), timeout);
        }

        template<Mappable T>
        [[nodiscard]] net::awaitable<std::vector<T>> async_fetch(
            sql_template query, std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
            require(transaction_status::active, "fetch");
            co_return co_await conn_->async_fetch<T>(std::move(query), timeout);
        }

        // Server-side cursor living inside this transaction
        template<Mappable T>
        [[nodiscard]] database_cursor<T> cursor(const sql_template& query, std::size_t prefetch = 50);

        // Check transaction state
        [[nodiscard]] transaction_status status() const noexcept {
            return status_;
        }

        [[nodiscard]] bool is_active() const noexcept {
            return status_ == transaction_status::active;
        }

        [[nodiscard]] bool is_savepoint() const noexcept {
            return level_ > 1;
        }

        // 1 for the outermost transaction, 2 for its first savepoint, ...
        [[nodiscard]] std::size_t level() const noexcept {
            return level_;
        }

        [[nodiscard]] database_connection& connection() {
            if (!conn_) {
                throw illegal_state_error{"Transaction was moved from"};
            }
            return *conn_;
        }

    private:
        template<Mappable T>
        friend class database_cursor;

        // Adopts a transaction already begun on the server
        database_transaction(database_connection& conn, std::size_t level, std::string savepoint)
            : conn_(&conn), level_(level), savepoint_(std::move(savepoint)) {}

        static std::string begin_statement(database_connection& conn, const transaction_options& options,
                                           std::size_t level, std::string& savepoint) {
            if (level > 1) {
                if (options.isolation || options.mode || options.deferrable) {
                    throw illegal_state_error{"Transaction options cannot be applied to a savepoint"};
                }
                savepoint = "tessera_sp_" + std::to_string(++conn.savepoint_counter_);
                return "SAVEPOINT " + savepoint;
            }

            std::string text = "BEGIN";
            if (options.isolation) {
                text += " ISOLATION LEVEL ";
                switch (*options.isolation) {
                    case isolation_level::read_uncommitted: text += "READ UNCOMMITTED"; break;
                    case isolation_level::read_committed: text += "READ COMMITTED"; break;
                    case isolation_level::repeatable_read: text += "REPEATABLE READ"; break;
                    case isolation_level::serializable: text += "SERIALIZABLE"; break;
                }
            }
            if (options.mode) {
                text += *options.mode == access_mode::read_only ? " READ ONLY" : " READ WRITE";
            }
            if (options.deferrable) {
                text += " DEFERRABLE";
            }
            return text;
        }

        [[nodiscard]] std::string finish_statement(bool commit) const {
            if (level_ > 1) {
                return (commit ? "RELEASE SAVEPOINT " : "ROLLBACK TO SAVEPOINT ") + savepoint_;
            }
            return commit ? "COMMIT" : "ROLLBACK";
        }

        // COMMIT of a failed transaction succeeds on the wire but reports ROLLBACK
        void check_committed(const result_set& result) {
            if (level_ == 1 && result.command_tag() == "ROLLBACK") {
                throw wire_error{"Transaction was rolled back by the server", "25P02"};
            }
            status_ = transaction_status::committed;
        }

        [[nodiscard]] bool is_open() const noexcept {
            return status_ == transaction_status::active ||
                   status_ == transaction_status::marked_for_rollback;
        }

        [[nodiscard]] bool can_send() const noexcept {
            const auto state = conn_->state();
            return !conn_->is_busy() && state != link_state::broken && state != link_state::busy;
        }

        void require(transaction_status expected, std::string_view action) const {
            if (!conn_) {
                throw illegal_state_error{"Transaction was moved from"};
            }
            if (status_ != expected) {
                throw illegal_state_error{
                    "Cannot " + std::string(action) + ": transaction is " + std::string(status_name(status_))};
            }
        }

        void require_innermost(std::string_view action) const {
            if (conn_->transaction_depth_ != level_) {
                throw illegal_state_error{
                    "Cannot " + std::string(action) + " while a nested savepoint is still active"};
            }
        }

        database_connection* conn_;
        std::size_t level_;
        std::string savepoint_;
        transaction_status status_ = transaction_status::active;
    };

    namespace detail {

        template<typename A>
        struct awaitable_value;

        template<typename T>
        struct awaitable_value<net::awaitable<T>> {
            using type = T;
        };

    } // namespace detail

    // Scoped transaction helper: commits when func returns, rolls back when it
    // throws and rethrows the original exception
    template<typename Func>
    requires std::invocable<Func, database_transaction&>
    auto with_transaction(database_connection& conn, Func&& func, const transaction_options& options = {}) {
        database_transaction txn(conn, options);

        try {
            if constexpr (std::is_void_v<std::invoke_result_t<Func, database_transaction&>>) {
                std::invoke(std::forward<Func>(func), txn);
                txn.complete();
            } else {
                auto result = std::invoke(std::forward<Func>(func), txn);
                txn.complete();
                return result;
            }
        } catch (...) {
            txn.abort_after_failure();
            throw;
        }
    }

    // Coroutine form: func returns net::awaitable<R>
    template<typename Func>
    requires std::invocable<Func&, database_transaction&>
    auto async_with_transaction(database_connection& conn, Func func, transaction_options options = {})
        -> net::awaitable<typename detail::awaitable_value<std::invoke_result_t<Func&, database_transaction&>>::type> {
        using result_type = typename detail::awaitable_value<std::invoke_result_t<Func&, database_transaction&>>::type;

        auto txn = co_await database_transaction::async_begin(conn, options);
        std::exception_ptr failure;
        try {
            if constexpr (std::is_void_v<result_type>) {
                co_await std::invoke(func, txn);
                co_await txn.async_complete();
                co_return;
            } else {
                auto result = co_await std::invoke(func, txn);
                co_await txn.async_complete();
                co_return result;
            }
        } catch (...) {
            failure = std::current_exception();
        }
        co_await txn.async_abort_after_failure();
        std::rethrow_exception(failure);
    }

    inline database_transaction database_connection::transaction() {
        return database_transaction(*this);
    }

    inline database_transaction database_connection::transaction(const transaction_options& options) {
        return database_transaction(*this, options);
    }

    template<typename Func>
    requires std::invocable<Func, database_transaction&>
    auto database_connection::transaction(Func&& func, const transaction_options& options) {
        return with_transaction(*this, std::forward<Func>(func), options);
    }

} // namespace tessera

#include "database_cursor.hpp"
