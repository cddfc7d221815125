#pragma once

#include "database_transaction.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace tessera {

    // Forward-only server-side cursor. Lives inside the transaction that
    // declared it and is closed by the server when that transaction ends.
    template<Mappable T>
    class database_cursor {
    public:
        database_cursor(database_transaction& txn, const sql_template& query, std::size_t prefetch = 50)
            : txn_(&txn), prefetch_(prefetch == 0 ? 1 : prefetch) {
            txn.require(transaction_status::active, "declare a cursor");
            auto& conn = *txn.conn_;
            name_ = pq::quote_identifier("tessera_cursor_" + std::to_string(++conn.cursor_counter_));

            auto compiled = conn.compiler_.compile(query);
            compiled.text = "DECLARE " + name_ + " NO SCROLL CURSOR FOR " + compiled.text;
            conn.run(compiled, std::nullopt);
        }

        database_cursor(const database_cursor&) = delete;
        database_cursor& operator=(const database_cursor&) = delete;
        database_cursor(database_cursor&&) noexcept = default;
        database_cursor& operator=(database_cursor&&) noexcept = default;

        // Up to n further rows; fewer at the end of the result
        [[nodiscard]] std::vector<T> fetch(std::size_t n) {
            auto rows = command("FETCH FORWARD " + std::to_string(n) + " FROM ");
            return result_mapper::map<T>(rows);
        }

        [[nodiscard]] std::optional<T> fetchrow() {
            return result_mapper::map_single_row<T>(command("FETCH NEXT FROM "));
        }

        // Skip n rows; returns how many were actually skipped
        std::uint64_t forward(std::size_t n) {
            return command("MOVE FORWARD " + std::to_string(n) + " IN ").affected_rows();
        }

        void close() {
            if (closed_) return;
            closed_ = true;
            if (txn_->is_active()) {
                run("CLOSE " + name_);
            }
        }

        [[nodiscard]] bool is_closed() const noexcept {
            return closed_;
        }

        [[nodiscard]] const std::string& name() const noexcept {
            return name_;
        }

        // Next row, refilling the buffer prefetch rows at a time
        [[nodiscard]] std::optional<T> next() {
            if (buffer_.empty() && !exhausted_) {
                auto batch = fetch(prefetch_);
                exhausted_ = batch.size() < prefetch_;
                for (auto& item : batch) {
                    buffer_.push_back(std::move(item));
                }
            }
            if (buffer_.empty()) {
                return std::nullopt;
            }
            std::optional<T> item(std::move(buffer_.front()));
            buffer_.pop_front();
            return item;
        }

        class iterator {
        public:
            using value_type = T;
            using difference_type = std::ptrdiff_t;
            using iterator_concept = std::input_iterator_tag;

            iterator() = default;
            explicit iterator(database_cursor* cursor) : cursor_(cursor) {
                advance();
            }

            const T& operator*() const { return *current_; }
            const T* operator->() const { return &*current_; }

            iterator& operator++() {
                advance();
                return *this;
            }

            void operator++(int) { advance(); }

            friend bool operator==(const iterator& it, std::default_sentinel_t) noexcept {
                return !it.current_.has_value();
            }

        private:
            void advance() {
                current_ = cursor_->next();
            }

            database_cursor* cursor_ = nullptr;
            std::optional<T> current_;
        };

        [[nodiscard]] iterator begin() {
            return iterator(this);
        }

        [[nodiscard]] std::default_sentinel_t end() const noexcept {
            return {};
        }

    private:
        result_set command(const std::string& prefix) {
            if (closed_) {
                throw illegal_state_error{"Cursor " + name_ + " is closed"};
            }
            return run(prefix + name_);
        }

        result_set run(std::string text) {
            txn_->require(transaction_status::active, "use a cursor");
            return txn_->conn_->run(compiled_statement{std::move(text), {}}, std::nullopt);
        }

        database_transaction* txn_;
        std::size_t prefetch_;
        std::string name_;
        std::deque<T> buffer_;
        bool exhausted_ = false;
        bool closed_ = false;
    };

    template<Mappable T>
    database_cursor<T> database_transaction::cursor(const sql_template& query, std::size_t prefetch) {
        return database_cursor<T>(*this, query, prefetch);
    }

} // namespace tessera
