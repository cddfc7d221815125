#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/tessera.hpp"
#include "fake_link.hpp"
#include <chrono>
#include <stdexcept>
#include <string>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

using namespace tessera;
using tessera::testing::fake_server;
using tessera::testing::make_rows;
using tessera::testing::run_blocking;
using Catch::Matchers::ContainsSubstring;

namespace {

    struct business_rule_violation : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

} // namespace

TEST_CASE("database_transaction - Scoped helper commits exactly once", "[transaction]") {
    auto server = std::make_shared<fake_server>();
    auto conn = server->connect();
    server->respond("RETURNING", make_rows({"id"}, {{std::int64_t{11}}}));

    auto id = with_transaction(*conn, [](database_transaction& txn) {
        txn.execute(sql("UPDATE accounts SET balance = balance - {} WHERE id = {}", 10, 1));
        return txn.fetchval<std::int64_t>(sql("INSERT INTO ledger VALUES ({}) RETURNING id", 10));
    });

    REQUIRE(id == 11);
    REQUIRE(server->count_exact("BEGIN") == 1);
    REQUIRE(server->count_exact("COMMIT") == 1);
    REQUIRE(server->count_exact("ROLLBACK") == 0);
    REQUIRE(conn->transaction_depth() == 0);
    REQUIRE(conn->state() == link_state::idle);

    SECTION("Member form behaves the same") {
        conn->transaction([](database_transaction& txn) {
            txn.execute(sql("SELECT 1"));
        });
        REQUIRE(server->count_exact("COMMIT") == 2);
    }
}

TEST_CASE("database_transaction - Failure rolls back and rethrows the original", "[transaction][error]") {
    auto server = std::make_shared<fake_server>();
    auto conn = server->connect();

    SECTION("Application exception") {
        REQUIRE_THROWS_AS(with_transaction(*conn, [](database_transaction& txn) {
            txn.execute(sql("UPDATE accounts SET balance = 0"));
            throw business_rule_violation{"overdrawn"};
        }), business_rule_violation);

        REQUIRE(server->count_exact("ROLLBACK") == 1);
        REQUIRE(server->count_exact("COMMIT") == 0);
    }

    SECTION("Server error keeps its SQLSTATE") {
        server->fail_on("INSERT", "23505");
        try {
            with_transaction(*conn, [](database_transaction& txn) {
                txn.execute(sql("INSERT INTO accounts VALUES ({})", 1));
            });
            FAIL("transaction should have failed");
        } catch (const wire_error& e) {
            REQUIRE(e.sql_state == "23505");
        }
        REQUIRE(server->count_exact("ROLLBACK") == 1);
        REQUIRE(conn->state() == link_state::idle);
    }

    SECTION("Cancellation and timeout inside the scope") {
        REQUIRE_THROWS_AS(with_transaction(*conn, [](database_transaction& txn) {
            txn.execute(sql("UPDATE accounts SET balance = 0"));
            throw operation_cancelled_error{"stopped by caller"};
        }), operation_cancelled_error);
        REQUIRE(server->count_exact("ROLLBACK") == 1);

        REQUIRE_THROWS_AS(with_transaction(*conn, [](database_transaction&) {
            throw timeout_error{"took too long"};
        }), timeout_error);
        REQUIRE(server->count_exact("ROLLBACK") == 2);
        REQUIRE(server->count_exact("COMMIT") == 0);
        REQUIRE(conn->transaction_depth() == 0);
    }

    SECTION("Rollback failure does not mask the original error") {
        server->break_on("ROLLBACK");
        REQUIRE_THROWS_AS(with_transaction(*conn, [](database_transaction&) {
            throw business_rule_violation{"first"};
        }), business_rule_violation);
        REQUIRE_FALSE(conn->is_healthy());
    }

    SECTION("Lost connection skips the rollback") {
        server->break_on("INSERT");
        REQUIRE_THROWS_AS(with_transaction(*conn, [](database_transaction& txn) {
            txn.execute(sql("INSERT INTO accounts VALUES ({})", 1));
        }), wire_error);
        REQUIRE(server->count_exact("ROLLBACK") == 0);
    }

    SECTION("Failing COMMIT is neither retried nor followed by ROLLBACK") {
        server->fail_on("COMMIT", "40001");
        REQUIRE_THROWS_AS(with_transaction(*conn, [](database_transaction& txn) {
            txn.execute(sql("SELECT 1"));
        }), wire_error);
        REQUIRE(server->count_exact("COMMIT") == 1);
        REQUIRE(server->count_exact("ROLLBACK") == 0);
    }
}

TEST_CASE("database_transaction - Guard lifecycle", "[transaction]") {
    auto server = std::make_shared<fake_server>();
    auto conn = server->connect();

    SECTION("Destruction without commit rolls back") {
        {
            auto txn = conn->transaction();
            txn.execute(sql("DELETE FROM accounts"));
        }
        REQUIRE(server->count_exact("ROLLBACK") == 1);
        REQUIRE(conn->transaction_depth() == 0);
    }

    SECTION("Terminal states reject further use") {
        auto txn = conn->transaction();
        txn.commit();
        REQUIRE(txn.status() == transaction_status::committed);
        REQUIRE_THROWS_AS(txn.commit(), illegal_state_error);
        REQUIRE_THROWS_AS(txn.rollback(), illegal_state_error);
        REQUIRE_THROWS_AS(txn.execute(sql("SELECT 1")), illegal_state_error);
        REQUIRE(server->count_exact("COMMIT") == 1);
    }

    SECTION("Marked for rollback") {
        auto txn = conn->transaction();
        txn.mark_for_rollback();
        REQUIRE(txn.status() == transaction_status::marked_for_rollback);
        REQUIRE_THROWS_AS(txn.execute(sql("SELECT 1")), illegal_state_error);
        REQUIRE_THROWS_AS(txn.commit(), illegal_state_error);
        txn.complete();
        REQUIRE(txn.status() == transaction_status::rolled_back);
        REQUIRE(server->count_exact("ROLLBACK") == 1);
        REQUIRE(server->count_exact("COMMIT") == 0);
    }

    SECTION("Moved guard owns the transaction") {
        {
            auto first = conn->transaction();
            database_transaction second(std::move(first));
            REQUIRE(second.is_active());
            REQUIRE_THROWS_AS(first.connection(), illegal_state_error);
        }
        REQUIRE(server->count_exact("ROLLBACK") == 1);
    }

    SECTION("Server reports a rolled back commit") {
        auto txn = conn->transaction();
        server->fail_on("bad");
        REQUIRE_THROWS_AS(txn.execute(sql("SELECT bad")), wire_error);
        REQUIRE(conn->state() == link_state::failed_transaction);

        try {
            txn.commit();
            FAIL("commit of a failed transaction should throw");
        } catch (const wire_error& e) {
            REQUIRE(e.sql_state == "25P02");
        }
        REQUIRE(txn.status() == transaction_status::rolled_back);
        REQUIRE(server->count_exact("ROLLBACK") == 0);
    }
}

TEST_CASE("database_transaction - BEGIN options", "[transaction]") {
    auto server = std::make_shared<fake_server>();
    auto conn = server->connect();

    transaction_options options;
    options.isolation = isolation_level::serializable;
    options.mode = access_mode::read_only;
    options.deferrable = true;

    {
        auto txn = conn->transaction(options);
        txn.commit();
    }
    REQUIRE(server->count_exact("BEGIN ISOLATION LEVEL SERIALIZABLE READ ONLY DEFERRABLE") == 1);

    transaction_options repeatable;
    repeatable.isolation = isolation_level::repeatable_read;
    with_transaction(*conn, [](database_transaction&) {}, repeatable);
    REQUIRE(server->count_exact("BEGIN ISOLATION LEVEL REPEATABLE READ") == 1);
}

TEST_CASE("database_transaction - Nested scopes use savepoints", "[transaction][savepoint]") {
    auto server = std::make_shared<fake_server>();
    auto conn = server->connect();

    SECTION("Inner failure rolls back only the savepoint") {
        with_transaction(*conn, [&](database_transaction& outer) {
            outer.execute(sql("INSERT INTO a VALUES (1)"));
            REQUIRE_THROWS_AS(with_transaction(*conn, [](database_transaction& inner) {
                REQUIRE(inner.is_savepoint());
                REQUIRE(inner.level() == 2);
                throw business_rule_violation{"inner"};
            }), business_rule_violation);
            outer.execute(sql("INSERT INTO a VALUES (2)"));
        });

        auto texts = server->texts();
        REQUIRE(texts == std::vector<std::string>{
            "BEGIN",
            "INSERT INTO a VALUES (1)",
            "SAVEPOINT tessera_sp_1",
            "ROLLBACK TO SAVEPOINT tessera_sp_1",
            "INSERT INTO a VALUES (2)",
            "COMMIT"});
    }

    SECTION("Inner success releases the savepoint") {
        with_transaction(*conn, [&](database_transaction&) {
            with_transaction(*conn, [](database_transaction& inner) {
                inner.execute(sql("SELECT 1"));
            });
        });
        REQUIRE(server->count_exact("RELEASE SAVEPOINT tessera_sp_1") == 1);
        REQUIRE(server->count_exact("COMMIT") == 1);
    }

    SECTION("Savepoint recovers a failed statement") {
        server->fail_on("dup", "23505");
        with_transaction(*conn, [&](database_transaction& outer) {
            REQUIRE_THROWS_AS(with_transaction(*conn, [](database_transaction& inner) {
                inner.execute(sql("INSERT dup"));
            }), wire_error);
            REQUIRE(conn->state() == link_state::in_transaction);
            outer.execute(sql("SELECT after"));
        });
        REQUIRE(server->count_exact("COMMIT") == 1);
    }

    SECTION("Outer scope cannot finish while a savepoint is open") {
        auto outer = conn->transaction();
        auto inner = conn->transaction();
        REQUIRE_THROWS_AS(outer.commit(), illegal_state_error);
        inner.commit();
        outer.commit();
        REQUIRE(server->count_exact("COMMIT") == 1);
    }

    SECTION("Savepoints take no options") {
        auto outer = conn->transaction();
        transaction_options options;
        options.mode = access_mode::read_only;
        REQUIRE_THROWS_AS(conn->transaction(options), illegal_state_error);
    }
}

TEST_CASE("database_transaction - Coroutine scope", "[transaction][async]") {
    auto server = std::make_shared<fake_server>();
    auto conn = server->connect();
    server->respond("count", make_rows({"count"}, {{std::int64_t{3}}}));

    SECTION("Commit") {
        auto count = run_blocking(async_with_transaction(*conn,
            [](database_transaction& txn) -> net::awaitable<std::int64_t> {
                co_await txn.async_execute(sql("UPDATE t SET v = {}", 1));
                auto rows = co_await txn.async_fetch<std::int64_t>(sql("SELECT count"));
                co_return rows.at(0);
            }));

        REQUIRE(count == 3);
        REQUIRE(server->count_exact("COMMIT") == 1);
        REQUIRE(server->count_exact("ROLLBACK") == 0);
    }

    SECTION("Rollback and rethrow") {
        REQUIRE_THROWS_AS(run_blocking(async_with_transaction(*conn,
            [](database_transaction& txn) -> net::awaitable<void> {
                co_await txn.async_execute(sql("UPDATE t SET v = {}", 1));
                throw business_rule_violation{"async"};
            })), business_rule_violation);

        REQUIRE(server->count_exact("ROLLBACK") == 1);
        REQUIRE(server->count_exact("COMMIT") == 0);
        REQUIRE(conn->transaction_depth() == 0);
    }

    SECTION("Cancelled coroutine rolls back") {
        REQUIRE_THROWS_AS(run_blocking(async_with_transaction(*conn,
            [](database_transaction& txn) -> net::awaitable<void> {
                co_await txn.async_execute(sql("UPDATE t SET v = {}", 1));
                throw operation_cancelled_error{"cancelled"};
            })), operation_cancelled_error);

        REQUIRE(server->count_exact("ROLLBACK") == 1);
        REQUIRE(server->count_exact("COMMIT") == 0);
    }

    SECTION("Coroutine destroyed mid-scope rolls back") {
        bool suspended = false;
        {
            net::io_context ioc;
            net::co_spawn(ioc, async_with_transaction(*conn,
                [&suspended](database_transaction& txn) -> net::awaitable<void> {
                    co_await txn.async_execute(sql("UPDATE t SET v = {}", 1));
                    net::steady_timer never(co_await net::this_coro::executor, std::chrono::hours{1});
                    suspended = true;
                    co_await never.async_wait(net::use_awaitable);
                }), net::detached);
            ioc.run_for(std::chrono::milliseconds{50});
            REQUIRE(suspended);
            REQUIRE(conn->transaction_depth() == 1);
            // Destroying the context destroys the suspended frame
        }

        REQUIRE(server->count_exact("ROLLBACK") == 1);
        REQUIRE(server->count_exact("COMMIT") == 0);
        REQUIRE(conn->transaction_depth() == 0);
        REQUIRE(conn->state() == link_state::idle);
    }
}
