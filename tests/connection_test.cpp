#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/tessera.hpp"
#include "fake_link.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace tessera;
using namespace std::chrono_literals;
using tessera::testing::fake_server;
using tessera::testing::make_rows;
using tessera::testing::run_blocking;
using Catch::Matchers::ContainsSubstring;

namespace {

    struct account {
        std::int64_t id = 0;
        std::string owner;
        double balance = 0;
    };

} // namespace

template<>
struct tessera::record_shape<account> {
    static constexpr auto fields = std::make_tuple(
        field("id", &account::id),
        field("owner", &account::owner),
        field("balance", &account::balance));
};

TEST_CASE("database_connection - Construction", "[connection]") {
    REQUIRE_THROWS_AS(database_connection(nullptr), database_error);

    SECTION("Fresh connection is idle") {
        auto server = std::make_shared<fake_server>();
        auto conn = server->connect();
        REQUIRE(conn->state() == link_state::idle);
        REQUIRE(conn->is_healthy());
        REQUIRE_FALSE(conn->is_busy());
        REQUIRE(conn->statement_count() == 0);
    }

    SECTION("Closing releases the link") {
        auto server = std::make_shared<fake_server>();
        {
            auto conn = server->connect();
            conn->close();
            REQUIRE(server->links_closed() == 1);
            REQUIRE_FALSE(conn->is_healthy());
        }
        REQUIRE(server->links_closed() == 1);
    }
}

TEST_CASE("database_connection - Compiled statements reach the server", "[connection]") {
    auto server = std::make_shared<fake_server>();
    auto conn = server->connect();
    server->respond("FROM accounts", make_rows({"id", "owner", "balance"}, {
        {1, "ada", 10.5},
        {2, "bob", 0.0},
    }));

    auto filter = sql("owner <> {}", "eve");
    auto accounts = conn->fetch<account>(sql("SELECT * FROM accounts WHERE id > {} AND {}", 0, filter));

    REQUIRE(accounts.size() == 2);
    REQUIRE(accounts[0].owner == "ada");
    REQUIRE(accounts[1].balance == 0.0);

    auto sent = server->statements();
    REQUIRE(sent.size() == 1);
    REQUIRE(sent[0].text == "SELECT * FROM accounts WHERE id > $1 AND owner <> $2");
    REQUIRE(sent[0].parameters == std::vector<wire_value>{0, "eve"});
    REQUIRE(conn->statement_count() == 1);
}

TEST_CASE("database_connection - Row and value cardinality", "[connection][cardinality]") {
    auto server = std::make_shared<fake_server>();
    auto conn = server->connect();
    server->respond("none", make_rows({"id", "owner", "balance"}, {}));
    server->respond("one", make_rows({"id", "owner", "balance"}, {{3, "cy", 1.0}}));
    server->respond("two", make_rows({"id", "owner", "balance"}, {{1, "a", 1.0}, {2, "b", 2.0}}));
    server->respond("count", make_rows({"count"}, {{std::int64_t{42}}}));

    SECTION("fetchrow") {
        REQUIRE_FALSE(conn->fetchrow<account>(sql("SELECT none")).has_value());
        REQUIRE(conn->fetchrow<account>(sql("SELECT one"))->owner == "cy");
        REQUIRE_THROWS_AS(conn->fetchrow<account>(sql("SELECT two")), cardinality_error);
    }

    SECTION("fetchval") {
        REQUIRE(conn->fetchval<std::int64_t>(sql("SELECT count")) == 42);
        REQUIRE_THROWS_AS(conn->fetchval<std::int64_t>(sql("SELECT none")), cardinality_error);
        REQUIRE_THROWS_AS(conn->fetchval<std::int64_t>(sql("SELECT one")), cardinality_error);
    }
}

TEST_CASE("database_connection - execute reports affected rows", "[connection]") {
    auto server = std::make_shared<fake_server>();
    auto conn = server->connect();
    server->respond("UPDATE", result_set({}, "UPDATE 3", 3));

    REQUIRE(conn->execute(sql("UPDATE accounts SET balance = {}", 0)) == 3);
    REQUIRE(conn->execute(sql("CREATE TABLE t (id int)")) == 0);
}

TEST_CASE("database_connection - Server errors keep their SQLSTATE", "[connection][error]") {
    auto server = std::make_shared<fake_server>();
    auto conn = server->connect();
    server->fail_on("INSERT", "23505");

    try {
        conn->execute(sql("INSERT INTO accounts VALUES ({})", 1));
        FAIL("execute should have thrown");
    } catch (const wire_error& e) {
        REQUIRE(e.sql_state == "23505");
    }
    // The connection stays usable after a statement error
    REQUIRE(conn->is_healthy());
    REQUIRE_NOTHROW(conn->execute(sql("SELECT 1")));
}

TEST_CASE("database_connection - One statement at a time", "[connection][busy]") {
    auto server = std::make_shared<fake_server>();
    auto conn = server->connect();
    std::atomic<bool> rejected{false};

    server->respond_with([&](const compiled_statement& s) -> std::optional<result_set> {
        if (s.text == "SELECT outer") {
            REQUIRE(conn->is_busy());
            try {
                conn->execute(sql("SELECT inner"));
            } catch (const connection_busy_error&) {
                rejected = true;
            }
        }
        return std::nullopt;
    });

    conn->execute(sql("SELECT outer"));

    REQUIRE(rejected);
    REQUIRE_FALSE(conn->is_busy());
    REQUIRE(server->count_exact("SELECT inner") == 0);
}

TEST_CASE("database_connection - Timeouts and cancellation", "[connection][timeout]") {
    auto server = std::make_shared<fake_server>();
    auto conn = server->connect();
    server->hang_on("pg_sleep");

    SECTION("Per-call timeout") {
        REQUIRE_THROWS_AS(conn->execute(sql("SELECT pg_sleep(10)"), 20ms), timeout_error);
        REQUIRE_FALSE(conn->is_healthy());
        REQUIRE(conn->state() == link_state::broken);
        REQUIRE_FALSE(conn->is_busy());
    }

    SECTION("Default timeout applies when the call passes none") {
        conn->set_default_timeout(20ms);
        REQUIRE_THROWS_AS(conn->execute(sql("SELECT pg_sleep(10)")), timeout_error);
    }

    SECTION("Cancel from another thread") {
        std::thread canceller([&] {
            std::this_thread::sleep_for(20ms);
            conn->cancel();
        });
        try {
            conn->execute(sql("SELECT pg_sleep(10)"));
            FAIL("execute should have been cancelled");
        } catch (const wire_error& e) {
            REQUIRE(e.sql_state == "57014");
        }
        canceller.join();
        REQUIRE_FALSE(conn->is_healthy());
    }
}

TEST_CASE("database_connection - LISTEN and NOTIFY", "[connection][notify]") {
    auto server = std::make_shared<fake_server>();
    auto conn = server->connect();
    std::vector<std::string> payloads;

    auto first = conn->add_listener("orders", [&](database_connection&, const notification& n) {
        payloads.push_back("first:" + n.payload);
    });
    auto second = conn->add_listener("orders", [&](database_connection&, const notification& n) {
        payloads.push_back("second:" + n.payload);
    });

    // One LISTEN per channel
    REQUIRE(server->count_exact("LISTEN \"orders\"") == 1);
    REQUIRE(conn->listener_count() == 2);

    server->notify("orders", "42");
    server->notify("other", "ignored");
    REQUIRE(conn->dispatch_notifications(100ms) == 2);
    REQUIRE(payloads == std::vector<std::string>{"first:42", "second:42"});

    SECTION("Nothing pending") {
        REQUIRE(conn->dispatch_notifications(10ms) == 0);
    }

    SECTION("UNLISTEN only after the last listener goes") {
        conn->remove_listener(first);
        REQUIRE(server->count_prefix("UNLISTEN") == 0);
        conn->remove_listener(second);
        REQUIRE(server->count_exact("UNLISTEN \"orders\"") == 1);
        REQUIRE_THROWS_AS(conn->remove_listener(second), illegal_state_error);
    }

    SECTION("Handlers may remove themselves") {
        std::uint64_t once = 0;
        once = conn->add_listener("jobs", [&](database_connection& c, const notification&) {
            c.remove_listener(once);
        });
        server->notify("jobs", "");
        REQUIRE(conn->dispatch_notifications(100ms) == 1);
        REQUIRE(conn->listener_count() == 2);
    }

    SECTION("Empty handler") {
        REQUIRE_THROWS_AS(conn->add_listener("x", nullptr), database_error);
    }
}

TEST_CASE("database_connection - Reset before reuse", "[connection][reuse]") {
    auto server = std::make_shared<fake_server>();
    auto conn = server->connect();

    SECTION("Idle connection needs nothing") {
        REQUIRE(conn->prepare_for_reuse());
        REQUIRE(server->statements().empty());
    }

    SECTION("Open transaction is rolled back") {
        auto txn = conn->transaction();
        REQUIRE(conn->prepare_for_reuse());
        REQUIRE(server->count_exact("ROLLBACK") == 1);
        REQUIRE(conn->transaction_depth() == 0);
    }

    SECTION("Listeners are dropped") {
        conn->add_listener("orders", [](database_connection&, const notification&) {});
        REQUIRE(conn->prepare_for_reuse());
        REQUIRE(server->count_exact("UNLISTEN *") == 1);
        REQUIRE(conn->listener_count() == 0);
    }

    SECTION("Broken connection cannot be reused") {
        server->last_link()->sever();
        REQUIRE_FALSE(conn->prepare_for_reuse());
    }

    SECTION("Statement still in flight") {
        server->last_link()->simulate_in_flight();
        REQUIRE_FALSE(conn->prepare_for_reuse());
    }

    SECTION("Failed reset") {
        auto txn = conn->transaction();
        server->break_on("ROLLBACK");
        REQUIRE_FALSE(conn->prepare_for_reuse());
    }
}

TEST_CASE("database_connection - Async queries", "[connection][async]") {
    auto server = std::make_shared<fake_server>();
    auto conn = server->connect();
    server->respond("FROM accounts", make_rows({"id", "owner", "balance"}, {{1, "ada", 5.0}}));
    server->respond("count", make_rows({"count"}, {{std::int64_t{7}}}));
    server->respond("UPDATE", result_set({}, "UPDATE 2", 2));

    auto rows = run_blocking(conn->async_fetch<account>(sql("SELECT * FROM accounts WHERE id = {}", 1)));
    REQUIRE(rows.size() == 1);
    REQUIRE(rows[0].owner == "ada");

    REQUIRE(run_blocking(conn->async_fetchval<std::int64_t>(sql("SELECT count"))) == 7);
    REQUIRE(run_blocking(conn->async_execute(sql("UPDATE accounts SET owner = {}", "x"))) == 2);

    auto one = run_blocking(conn->async_fetchrow<account>(sql("SELECT * FROM accounts")));
    REQUIRE(one.has_value());

    SECTION("Errors surface through the awaitable") {
        server->fail_on("DELETE");
        REQUIRE_THROWS_AS(run_blocking(conn->async_execute(sql("DELETE FROM accounts"))), wire_error);
        REQUIRE_FALSE(conn->is_busy());
    }

    SECTION("Template arguments outlive the caller's temporaries") {
        auto task = conn->async_execute(sql("UPDATE accounts SET owner = {}", std::string("temp")));
        REQUIRE(run_blocking(std::move(task)) == 2);
        REQUIRE(server->statements().back().parameters[0] == wire_value("temp"));
    }
}
