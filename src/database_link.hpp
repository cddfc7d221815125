#pragma once

#include "database_config.hpp"
#include "database_result.hpp"
#include "database_template.hpp"
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tessera {

    namespace net = boost::asio;

    using deadline = std::chrono::steady_clock::time_point;

    // What the link can be trusted with right now
    enum class link_state {
        idle,
        in_transaction,
        failed_transaction,
        busy,
        broken
    };

    // Asynchronous NOTIFY delivered by the server
    struct notification {
        int pid = 0;
        std::string channel;
        std::string payload;
    };

    // One network link to the server. Implementations surface server failures
    // as wire_error; an expired deadline throws timeout_error and leaves the
    // link broken so it is never reused.
    class wire_link {
    public:
        virtual ~wire_link() = default;

        virtual result_set send(const compiled_statement& statement, std::optional<deadline> until) = 0;

        virtual net::awaitable<result_set> async_send(compiled_statement statement,
                                                      std::optional<deadline> until) = 0;

        [[nodiscard]] virtual link_state state() const noexcept = 0;

        // Safe to call from any thread; aborts the statement in flight and breaks the link
        virtual void cancel() noexcept = 0;

        // Notifications received so far, oldest first
        virtual std::vector<notification> take_notifications() = 0;

        // Wait until the server sends data; false if the deadline passed first
        virtual bool wait_readable(std::optional<deadline> until) = 0;

        virtual void close() noexcept = 0;
    };

    using link_factory = std::function<std::unique_ptr<wire_link>(const connection_config&)>;

} // namespace tessera
