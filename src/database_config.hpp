#pragma once

#include "database_error.hpp"
#include <charconv>
#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tessera {

    // Connection settings, built field by field or parsed from a URL
    struct connection_config {
        std::string host = "localhost";
        std::string port = "5432";
        std::string database;
        std::string user;
        std::string password;
        std::chrono::seconds connect_timeout{30};
        std::string application_name = "tessera";
        std::string client_encoding = "UTF8";
        // Extra libpq keywords (sslmode, options, ...)
        std::vector<std::pair<std::string, std::string>> options;

        // postgres[ql]://user:password@host:port/database?key=value&...
        [[nodiscard]] static connection_config parse(std::string_view url);
    };

    namespace detail {

        inline int hex_digit(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        inline std::string percent_decode(std::string_view in, std::string_view what) {
            std::string out;
            out.reserve(in.size());
            for (std::size_t i = 0; i < in.size(); ++i) {
                if (in[i] != '%') {
                    out += in[i];
                    continue;
                }
                if (i + 2 >= in.size()) {
                    throw configuration_error{"Truncated percent escape in " + std::string(what)};
                }
                const int hi = hex_digit(in[i + 1]);
                const int lo = hex_digit(in[i + 2]);
                if (hi < 0 || lo < 0) {
                    throw configuration_error{"Invalid percent escape in " + std::string(what)};
                }
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
            }
            return out;
        }

    } // namespace detail

    inline connection_config connection_config::parse(std::string_view url) {
        if (url.empty()) {
            throw configuration_error{"Connection string is empty"};
        }

        const auto scheme_end = url.find("://");
        if (scheme_end == std::string_view::npos) {
            throw configuration_error{"Connection string has no scheme: expected postgres://..."};
        }
        const auto scheme = url.substr(0, scheme_end);
        if (scheme != "postgres" && scheme != "postgresql") {
            throw configuration_error{"Unsupported connection scheme '" + std::string(scheme) + "'"};
        }

        connection_config config;
        std::string_view rest = url.substr(scheme_end + 3);

        std::string_view query;
        if (auto q = rest.find('?'); q != std::string_view::npos) {
            query = rest.substr(q + 1);
            rest = rest.substr(0, q);
        }

        std::string_view path;
        if (auto slash = rest.find('/'); slash != std::string_view::npos) {
            path = rest.substr(slash + 1);
            rest = rest.substr(0, slash);
        }

        // Credentials end at the last '@' so passwords may contain an escaped one
        if (auto at = rest.rfind('@'); at != std::string_view::npos) {
            const auto userinfo = rest.substr(0, at);
            rest = rest.substr(at + 1);
            if (auto colon = userinfo.find(':'); colon != std::string_view::npos) {
                config.user = detail::percent_decode(userinfo.substr(0, colon), "user name");
                config.password = detail::percent_decode(userinfo.substr(colon + 1), "password");
            } else {
                config.user = detail::percent_decode(userinfo, "user name");
            }
        }

        std::string_view host;
        std::string_view port;
        bool has_port = false;
        if (!rest.empty() && rest.front() == '[') {
            const auto close = rest.find(']');
            if (close == std::string_view::npos) {
                throw configuration_error{"Unterminated IPv6 host in connection string"};
            }
            host = rest.substr(1, close - 1);
            const auto after = rest.substr(close + 1);
            if (!after.empty()) {
                if (after.front() != ':') {
                    throw configuration_error{"Unexpected characters after IPv6 host"};
                }
                port = after.substr(1);
                has_port = true;
            }
        } else if (auto colon = rest.find(':'); colon != std::string_view::npos) {
            host = rest.substr(0, colon);
            port = rest.substr(colon + 1);
            has_port = true;
        } else {
            host = rest;
        }

        if (host.empty()) {
            throw configuration_error{"Connection string has no host"};
        }
        config.host = detail::percent_decode(host, "host");

        if (has_port) {
            if (port.empty()) {
                throw configuration_error{"Empty port in connection string"};
            }
            int number = 0;
            auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), number);
            if (ec != std::errc{} || ptr != port.data() + port.size() || number < 1 || number > 65535) {
                throw configuration_error{"Invalid port '" + std::string(port) + "' in connection string"};
            }
            config.port = std::string(port);
        }

        config.database = path.empty() ? config.user : detail::percent_decode(path, "database name");
        if (config.database.find('/') != std::string::npos) {
            throw configuration_error{"Database name may not contain '/'"};
        }

        while (!query.empty()) {
            const auto amp = query.find('&');
            const auto pair = query.substr(0, amp);
            query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
            if (pair.empty()) continue;

            const auto eq = pair.find('=');
            if (eq == std::string_view::npos || eq == 0) {
                throw configuration_error{"Malformed query parameter '" + std::string(pair) + "'"};
            }
            auto key = detail::percent_decode(pair.substr(0, eq), "query parameter");
            auto value = detail::percent_decode(pair.substr(eq + 1), "query parameter");

            if (key == "connect_timeout") {
                int seconds = 0;
                auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), seconds);
                if (ec != std::errc{} || ptr != value.data() + value.size() || seconds < 0) {
                    throw configuration_error{"Invalid connect_timeout '" + value + "'"};
                }
                config.connect_timeout = std::chrono::seconds{seconds};
            } else if (key == "application_name") {
                config.application_name = std::move(value);
            } else if (key == "client_encoding") {
                config.client_encoding = std::move(value);
            } else if (key == "host" || key == "port" || key == "user" ||
                       key == "password" || key == "dbname") {
                throw configuration_error{"Parameter '" + key + "' must be given in the URL itself"};
            } else {
                config.options.emplace_back(std::move(key), std::move(value));
            }
        }

        return config;
    }

} // namespace tessera
