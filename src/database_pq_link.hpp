#pragma once

#include "database_error.hpp"
#include "database_link.hpp"
#include "database_pq_codec.hpp"
#include <libpq-fe.h>
#include <poll.h>
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace tessera {

    // wire_link over a libpq connection
    class pq_link final : public wire_link {
    public:
        explicit pq_link(const connection_config& config) {
            connect(config);
        }

        static std::unique_ptr<wire_link> open(const connection_config& config) {
            return std::make_unique<pq_link>(config);
        }

        pq_link(const pq_link&) = delete;
        pq_link& operator=(const pq_link&) = delete;

        ~pq_link() override {
            close();
        }

        result_set send(const compiled_statement& statement, std::optional<deadline> until) override {
            ensure_usable();
            dispatch(statement);

            while (true) {
                consume_input();
                if (PQisBusy(conn_) == 0) break;
                if (!wait_socket(until)) {
                    expire();
                }
            }
            return collect();
        }

        net::awaitable<result_set> async_send(compiled_statement statement,
                                              std::optional<deadline> until) override {
            ensure_usable();
            dispatch(statement);

            auto executor = co_await net::this_coro::executor;
            const int fd = PQsocket(conn_);
            if (fd < 0) {
                broken_ = true;
                throw wire_error{"Invalid socket from PostgreSQL connection"};
            }

            // libpq owns the socket; the descriptor only borrows it for waiting
            auto socket = std::make_shared<net::posix::stream_descriptor>(executor, fd);
            struct socket_releaser {
                net::posix::stream_descriptor& sock;
                ~socket_releaser() { sock.release(); }
            } releaser{*socket};

            auto expired = std::make_shared<std::atomic<bool>>(false);
            std::optional<net::steady_timer> timer;
            if (until) {
                timer.emplace(executor, *until);
                timer->async_wait([weak = std::weak_ptr(socket), expired](const boost::system::error_code& ec) {
                    if (ec) return;
                    *expired = true;
                    if (auto s = weak.lock()) {
                        boost::system::error_code ignored;
                        s->cancel(ignored);
                    }
                });
            }

            while (true) {
                consume_input();
                if (PQisBusy(conn_) == 0) break;
                if (*expired || (until && std::chrono::steady_clock::now() >= *until)) {
                    expire();
                }

                boost::system::error_code ec;
                co_await socket->async_wait(net::posix::stream_descriptor::wait_read,
                                            net::redirect_error(net::use_awaitable, ec));
                if (ec && !*expired) {
                    broken_ = true;
                    throw wire_error{"Socket wait failed: " + ec.message()};
                }
            }

            if (timer) timer->cancel();
            co_return collect();
        }

        [[nodiscard]] link_state state() const noexcept override {
            if (!conn_ || broken_ || PQstatus(conn_) != CONNECTION_OK) {
                return link_state::broken;
            }
            if (in_flight_) {
                return link_state::busy;
            }
            switch (PQtransactionStatus(conn_)) {
                case PQTRANS_IDLE: return link_state::idle;
                case PQTRANS_INTRANS: return link_state::in_transaction;
                case PQTRANS_INERROR: return link_state::failed_transaction;
                case PQTRANS_ACTIVE: return link_state::busy;
                default: return link_state::broken;
            }
        }

        void cancel() noexcept override {
            std::lock_guard lock(cancel_mutex_);
            broken_ = true;
            if (cancel_ && in_flight_) {
                char errbuf[256];
                if (PQcancel(cancel_, errbuf, sizeof(errbuf)) == 0) {
                    std::cerr << "[tessera] cancel request failed: " << errbuf << '\n';
                }
            }
        }

        std::vector<notification> take_notifications() override {
            if (conn_ && !broken_ && !in_flight_) {
                consume_input();
                drain_notifications();
            }
            return std::exchange(pending_, {});
        }

        bool wait_readable(std::optional<deadline> until) override {
            ensure_usable();
            if (!pending_.empty()) return true;
            consume_input();
            drain_notifications();
            if (!pending_.empty()) return true;
            return wait_socket(until);
        }

        void close() noexcept override {
            std::lock_guard lock(cancel_mutex_);
            if (cancel_) {
                PQfreeCancel(cancel_);
                cancel_ = nullptr;
            }
            if (conn_) {
                PQfinish(conn_);
                conn_ = nullptr;
            }
            broken_ = true;
        }

    private:
        void connect(const connection_config& config) {
            std::vector<std::pair<std::string, std::string>> params;
            auto add = [&](std::string key, std::string value) {
                if (!value.empty()) params.emplace_back(std::move(key), std::move(value));
            };
            add("host", config.host);
            add("port", config.port);
            add("dbname", config.database);
            add("user", config.user);
            add("password", config.password);
            add("connect_timeout", std::to_string(config.connect_timeout.count()));
            add("application_name", config.application_name);
            add("client_encoding", config.client_encoding);

            // Timestamps without an offset are read as UTC
            std::string session_options = "-c TimeZone=UTC";
            for (const auto& [key, value] : config.options) {
                if (key == "options") {
                    session_options += ' ';
                    session_options += value;
                } else {
                    add(key, value);
                }
            }
            add("options", session_options);

            std::vector<const char*> keywords;
            std::vector<const char*> values;
            for (const auto& [key, value] : params) {
                keywords.push_back(key.c_str());
                values.push_back(value.c_str());
            }
            keywords.push_back(nullptr);
            values.push_back(nullptr);

            conn_ = PQconnectdbParams(keywords.data(), values.data(), 0);
            if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
                std::string error = conn_ ? PQerrorMessage(conn_) : "out of memory";
                close();
                throw wire_error{"Failed to connect to database: " + error};
            }
            cancel_ = PQgetCancel(conn_);
        }

        void ensure_usable() const {
            if (!conn_ || broken_ || PQstatus(conn_) != CONNECTION_OK) {
                throw wire_error{"Connection is not valid"};
            }
            if (in_flight_) {
                throw connection_busy_error{"A statement is already in flight on this connection"};
            }
        }

        void dispatch(const compiled_statement& statement) {
            auto params = pq::encode_parameters(statement.parameters);
            const int ok = PQsendQueryParams(conn_, statement.text.c_str(), params.count(),
                                             params.types.data(), params.values.data(),
                                             params.lengths.data(), params.formats.data(), 0);
            if (ok == 0) {
                broken_ = PQstatus(conn_) != CONNECTION_OK;
                throw wire_error{"Failed to send query: " + std::string(PQerrorMessage(conn_))};
            }
            in_flight_ = true;
        }

        void consume_input() {
            if (PQconsumeInput(conn_) == 0) {
                broken_ = true;
                throw wire_error{"Failed to consume input: " + std::string(PQerrorMessage(conn_))};
            }
        }

        // Cancel the running statement and give up on the link
        [[noreturn]] void expire() {
            cancel();
            throw timeout_error{"Statement did not complete before its deadline"};
        }

        bool wait_socket(std::optional<deadline> until) {
            const int fd = PQsocket(conn_);
            if (fd < 0) {
                broken_ = true;
                throw wire_error{"Invalid socket from PostgreSQL connection"};
            }
            pollfd pfd{fd, POLLIN, 0};
            while (true) {
                int wait_ms = -1;
                if (until) {
                    const auto left = std::chrono::ceil<std::chrono::milliseconds>(
                        *until - std::chrono::steady_clock::now());
                    if (left.count() <= 0) return false;
                    wait_ms = static_cast<int>(std::min<long long>(left.count(), 60'000));
                }
                const int rc = ::poll(&pfd, 1, wait_ms);
                if (rc > 0) return true;
                if (rc < 0 && errno != EINTR) {
                    broken_ = true;
                    throw wire_error{"poll() failed: " + std::string(std::strerror(errno))};
                }
            }
        }

        // Drain every pending result; the first failure wins
        result_set collect() {
            result_set out;
            std::exception_ptr failure;
            while (PGresult* raw = PQgetResult(conn_)) {
                std::unique_ptr<PGresult, decltype(&PQclear)> res(raw, &PQclear);
                if (failure) continue;
                switch (PQresultStatus(raw)) {
                    case PGRES_COMMAND_OK:
                    case PGRES_TUPLES_OK:
                    case PGRES_EMPTY_QUERY:
                        try {
                            out = convert(raw);
                        } catch (const database_error&) {
                            failure = std::current_exception();
                        }
                        break;
                    default: {
                        const char* state = PQresultErrorField(raw, PG_DIAG_SQLSTATE);
                        failure = std::make_exception_ptr(
                            wire_error{PQresultErrorMessage(raw), state ? state : ""});
                        break;
                    }
                }
            }
            in_flight_ = false;
            if (PQstatus(conn_) != CONNECTION_OK) {
                broken_ = true;
            }
            drain_notifications();
            if (failure) {
                std::rethrow_exception(failure);
            }
            return out;
        }

        static result_set convert(const PGresult* res) {
            const int columns = PQnfields(res);
            const int rows = PQntuples(res);

            std::vector<std::string> names;
            std::vector<Oid> types;
            names.reserve(columns);
            for (int c = 0; c < columns; ++c) {
                names.emplace_back(PQfname(res, c));
                types.push_back(PQftype(res, c));
            }

            std::uint64_t affected = 0;
            const char* tuples = PQcmdTuples(const_cast<PGresult*>(res));
            if (tuples && *tuples) {
                const auto parsed = std::from_chars(tuples, tuples + std::strlen(tuples), affected);
                if (parsed.ec != std::errc{}) {
                    throw wire_error{"Malformed affected row count: " + std::string(tuples)};
                }
            }

            result_set out(std::move(names), PQcmdStatus(const_cast<PGresult*>(res)), affected);
            for (int r = 0; r < rows; ++r) {
                std::vector<wire_value> values;
                values.reserve(columns);
                for (int c = 0; c < columns; ++c) {
                    if (PQgetisnull(res, r, c)) {
                        values.emplace_back();
                    } else {
                        values.push_back(pq::decode_text(
                            std::string_view(PQgetvalue(res, r, c), PQgetlength(res, r, c)), types[c]));
                    }
                }
                out.add_row(std::move(values));
            }
            return out;
        }

        void drain_notifications() {
            while (PGnotify* n = PQnotifies(conn_)) {
                pending_.push_back(notification{n->be_pid, n->relname, n->extra ? n->extra : ""});
                PQfreemem(n);
            }
        }

        PGconn* conn_{nullptr};
        PGcancel* cancel_{nullptr};
        std::mutex cancel_mutex_;
        std::atomic<bool> broken_{false};
        std::atomic<bool> in_flight_{false};
        std::vector<notification> pending_;
    };

} // namespace tessera
