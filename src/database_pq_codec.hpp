#pragma once

#include "database_config.hpp"
#include "database_error.hpp"
#include "database_value.hpp"
#include <libpq-fe.h>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace tessera::pq {

    // Type OIDs from the pg_type catalog
    namespace oid {
        constexpr Oid unknown = 0;
        constexpr Oid boolean = 16;
        constexpr Oid bytea = 17;
        constexpr Oid int8 = 20;
        constexpr Oid int2 = 21;
        constexpr Oid int4 = 23;
        constexpr Oid text = 25;
        constexpr Oid object_id = 26;
        constexpr Oid float4 = 700;
        constexpr Oid float8 = 701;
        constexpr Oid date = 1082;
        constexpr Oid time = 1083;
        constexpr Oid timestamp = 1114;
        constexpr Oid timestamptz = 1184;
        constexpr Oid numeric = 1700;
    } // namespace oid

    // Element type of an array type, or oid::unknown when not an array we parse
    [[nodiscard]] constexpr Oid array_element(Oid type) noexcept {
        switch (type) {
            case 1000: return oid::boolean;
            case 1001: return oid::bytea;
            case 1005: return oid::int2;
            case 1007: return oid::int4;
            case 1016: return oid::int8;
            case 1028: return oid::object_id;
            case 1021: return oid::float4;
            case 1022: return oid::float8;
            case 1231: return oid::numeric;
            case 1182: return oid::date;
            case 1183: return oid::time;
            case 1115: return oid::timestamp;
            case 1185: return oid::timestamptz;
            case 1009:  // text[]
            case 1015:  // varchar[]
            case 1014:  // bpchar[]
            case 1003:  // name[]
            case 2951:  // uuid[]
            case 199:   // json[]
            case 3807:  // jsonb[]
                return oid::text;
            default:
                return oid::unknown;
        }
    }

    // Quote an identifier for use in generated statements
    [[nodiscard]] inline std::string quote_identifier(std::string_view name) {
        std::string out;
        out.reserve(name.size() + 2);
        out += '"';
        for (char c : name) {
            if (c == '"') out += '"';
            out += c;
        }
        out += '"';
        return out;
    }

    namespace detail {

        inline void append_padded(std::string& out, long long value, int width) {
            if (value < 0) {
                out += '-';
                value = -value;
            }
            const std::string digits = std::to_string(value);
            for (int i = static_cast<int>(digits.size()); i < width; ++i) out += '0';
            out += digits;
        }

        [[noreturn]] inline void malformed(std::string_view what, std::string_view text) {
            throw wire_error{"Malformed " + std::string(what) + " value from server: '" + std::string(text) + "'"};
        }

        // Read an unsigned decimal field of at least one digit
        inline bool read_number(std::string_view text, std::size_t& pos, long long& value) {
            const char* begin = text.data() + pos;
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc{} || ptr == begin) return false;
            pos += static_cast<std::size_t>(ptr - begin);
            return true;
        }

        inline bool expect(std::string_view text, std::size_t& pos, char c) {
            if (pos >= text.size() || text[pos] != c) return false;
            ++pos;
            return true;
        }

        // HH:MM:SS[.ffffff]
        inline bool read_time(std::string_view text, std::size_t& pos, std::chrono::microseconds& out) {
            long long h = 0, m = 0, s = 0;
            if (!read_number(text, pos, h) || !expect(text, pos, ':') ||
                !read_number(text, pos, m) || !expect(text, pos, ':') ||
                !read_number(text, pos, s)) {
                return false;
            }
            long long micros = 0;
            if (pos < text.size() && text[pos] == '.') {
                ++pos;
                int digits = 0;
                while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
                    if (digits < 6) {
                        micros = micros * 10 + (text[pos] - '0');
                        ++digits;
                    }
                    ++pos;
                }
                for (; digits < 6; ++digits) micros *= 10;
            }
            out = std::chrono::hours{h} + std::chrono::minutes{m} + std::chrono::seconds{s} +
                  std::chrono::microseconds{micros};
            return true;
        }

        // YYYY-MM-DD
        inline bool read_date(std::string_view text, std::size_t& pos, date& out) {
            long long y = 0, m = 0, d = 0;
            if (!read_number(text, pos, y) || !expect(text, pos, '-') ||
                !read_number(text, pos, m) || !expect(text, pos, '-') ||
                !read_number(text, pos, d)) {
                return false;
            }
            out = date{std::chrono::year{static_cast<int>(y)},
                       std::chrono::month{static_cast<unsigned>(m)},
                       std::chrono::day{static_cast<unsigned>(d)}};
            return out.ok();
        }

        inline void append_time(std::string& out, std::chrono::microseconds since_midnight) {
            using namespace std::chrono;
            const auto h = duration_cast<hours>(since_midnight);
            const auto m = duration_cast<minutes>(since_midnight - h);
            const auto s = duration_cast<seconds>(since_midnight - h - m);
            const auto us = since_midnight - h - m - s;
            append_padded(out, h.count(), 2);
            out += ':';
            append_padded(out, m.count(), 2);
            out += ':';
            append_padded(out, s.count(), 2);
            if (us.count() != 0) {
                out += '.';
                append_padded(out, us.count(), 6);
            }
        }

        inline void append_date(std::string& out, const date& d) {
            append_padded(out, static_cast<int>(d.year()), 4);
            out += '-';
            append_padded(out, static_cast<unsigned>(d.month()), 2);
            out += '-';
            append_padded(out, static_cast<unsigned>(d.day()), 2);
        }

        inline void append_quoted(std::string& out, std::string_view text) {
            out += '"';
            for (char c : text) {
                if (c == '"' || c == '\\') out += '\\';
                out += c;
            }
            out += '"';
        }

        inline std::string hex_bytes(const bytes& data) {
            static constexpr char digits[] = "0123456789abcdef";
            std::string out = "\\x";
            out.reserve(2 + data.size() * 2);
            for (std::byte b : data) {
                const auto v = std::to_integer<unsigned>(b);
                out += digits[v >> 4];
                out += digits[v & 0x0f];
            }
            return out;
        }

    } // namespace detail

    [[nodiscard]] inline std::string format_double(double value) {
        if (std::isnan(value)) return "NaN";
        if (std::isinf(value)) return value > 0 ? "Infinity" : "-Infinity";
        char buffer[64];
        auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
        return std::string(buffer, ptr);
    }

    [[nodiscard]] inline std::string format_date(const date& d) {
        std::string out;
        detail::append_date(out, d);
        return out;
    }

    [[nodiscard]] inline std::string format_time(time_of_day t) {
        std::string out;
        detail::append_time(out, t);
        return out;
    }

    // Always rendered in UTC with an explicit offset
    [[nodiscard]] inline std::string format_timestamp(timestamp ts) {
        const auto day = std::chrono::floor<std::chrono::days>(ts);
        std::string out;
        detail::append_date(out, date{day});
        out += ' ';
        detail::append_time(out, ts - day);
        out += "+00";
        return out;
    }

    // Text form of a value as the server accepts it; null has no text form
    [[nodiscard]] inline std::string encode_text(const wire_value& value) {
        switch (value.kind()) {
            case wire_kind::null:
                throw wire_error{"NULL has no text encoding"};
            case wire_kind::boolean:
                return *value.get_if<bool>() ? "t" : "f";
            case wire_kind::integer:
                return std::to_string(*value.get_if<std::int64_t>());
            case wire_kind::floating:
                return format_double(*value.get_if<double>());
            case wire_kind::text:
                return *value.get_if<std::string>();
            case wire_kind::bytes:
                return detail::hex_bytes(*value.get_if<bytes>());
            case wire_kind::date:
                return format_date(*value.get_if<date>());
            case wire_kind::time:
                return format_time(*value.get_if<time_of_day>());
            case wire_kind::timestamp:
                return format_timestamp(*value.get_if<timestamp>());
            case wire_kind::array: {
                std::string out = "{";
                bool first = true;
                for (const auto& element : *value.get_if<wire_array>()) {
                    if (!first) out += ',';
                    first = false;
                    switch (element.kind()) {
                        case wire_kind::null:
                            out += "NULL";
                            break;
                        case wire_kind::boolean:
                        case wire_kind::integer:
                        case wire_kind::floating:
                        case wire_kind::array:
                            out += encode_text(element);
                            break;
                        default:
                            detail::append_quoted(out, encode_text(element));
                            break;
                    }
                }
                out += '}';
                return out;
            }
        }
        throw wire_error{"Unknown wire kind"};
    }

    // Parameter arrays in the layout PQsendQueryParams expects
    struct encoded_parameters {
        std::vector<std::string> storage;
        std::vector<const char*> values;
        std::vector<int> lengths;
        std::vector<int> formats;
        std::vector<Oid> types;

        [[nodiscard]] int count() const noexcept {
            return static_cast<int>(values.size());
        }
    };

    [[nodiscard]] inline Oid parameter_type(const wire_value& value) noexcept {
        switch (value.kind()) {
            case wire_kind::boolean: return oid::boolean;
            case wire_kind::integer: return oid::int8;
            case wire_kind::floating: return oid::float8;
            case wire_kind::bytes: return oid::bytea;
            case wire_kind::date: return oid::date;
            case wire_kind::time: return oid::time;
            case wire_kind::timestamp: return oid::timestamptz;
            // left for the server to infer from context
            case wire_kind::null:
            case wire_kind::text:
            case wire_kind::array:
                return oid::unknown;
        }
        return oid::unknown;
    }

    // Text format for everything except bytes, which travel raw in binary format
    [[nodiscard]] inline encoded_parameters encode_parameters(const std::vector<wire_value>& params) {
        encoded_parameters out;
        out.storage.reserve(params.size());
        for (const auto& p : params) {
            out.types.push_back(parameter_type(p));
            if (p.is_null()) {
                out.storage.emplace_back();
                out.formats.push_back(0);
            } else if (auto raw = p.get_if<bytes>()) {
                out.storage.emplace_back(reinterpret_cast<const char*>(raw->data()), raw->size());
                out.formats.push_back(1);
            } else {
                out.storage.push_back(encode_text(p));
                out.formats.push_back(0);
            }
        }
        // pointers are taken once storage no longer reallocates
        for (std::size_t i = 0; i < params.size(); ++i) {
            out.values.push_back(params[i].is_null() ? nullptr : out.storage[i].data());
            out.lengths.push_back(static_cast<int>(out.storage[i].size()));
        }
        return out;
    }

    [[nodiscard]] inline date parse_date(std::string_view text) {
        std::size_t pos = 0;
        date d{};
        if (!detail::read_date(text, pos, d) || pos != text.size()) {
            detail::malformed("date", text);
        }
        return d;
    }

    [[nodiscard]] inline time_of_day parse_time(std::string_view text) {
        std::size_t pos = 0;
        time_of_day t{};
        if (!detail::read_time(text, pos, t) || pos != text.size()) {
            detail::malformed("time", text);
        }
        return t;
    }

    // YYYY-MM-DD HH:MM:SS[.ffffff][+HH[:MM[:SS]]], normalized to UTC
    [[nodiscard]] inline timestamp parse_timestamp(std::string_view text) {
        std::size_t pos = 0;
        date d{};
        time_of_day t{};
        if (!detail::read_date(text, pos, d) || !detail::expect(text, pos, ' ') ||
            !detail::read_time(text, pos, t)) {
            detail::malformed("timestamp", text);
        }
        std::chrono::seconds offset{0};
        if (pos < text.size()) {
            const char sign = text[pos];
            if (sign != '+' && sign != '-') detail::malformed("timestamp", text);
            ++pos;
            long long h = 0, m = 0, s = 0;
            if (!detail::read_number(text, pos, h)) detail::malformed("timestamp", text);
            if (detail::expect(text, pos, ':') && !detail::read_number(text, pos, m)) {
                detail::malformed("timestamp", text);
            }
            if (detail::expect(text, pos, ':') && !detail::read_number(text, pos, s)) {
                detail::malformed("timestamp", text);
            }
            if (pos != text.size()) detail::malformed("timestamp", text);
            offset = std::chrono::hours{h} + std::chrono::minutes{m} + std::chrono::seconds{s};
            if (sign == '-') offset = -offset;
        }
        return timestamp{std::chrono::sys_days{d}} + t - offset;
    }

    [[nodiscard]] inline bytes parse_bytea(std::string_view text) {
        bytes out;
        if (text.size() >= 2 && text[0] == '\\' && text[1] == 'x') {
            if (text.size() % 2 != 0) detail::malformed("bytea", text);
            out.reserve((text.size() - 2) / 2);
            for (std::size_t i = 2; i < text.size(); i += 2) {
                const int hi = tessera::detail::hex_digit(text[i]);
                const int lo = tessera::detail::hex_digit(text[i + 1]);
                if (hi < 0 || lo < 0) detail::malformed("bytea", text);
                out.push_back(static_cast<std::byte>(hi * 16 + lo));
            }
            return out;
        }
        for (char c : text) out.push_back(static_cast<std::byte>(c));
        return out;
    }

    [[nodiscard]] wire_value decode_text(std::string_view text, Oid type);

    namespace detail {

        inline wire_array parse_array_level(std::string_view text, std::size_t& pos, Oid element) {
            wire_array out;
            if (!expect(text, pos, '{')) malformed("array", text);
            if (expect(text, pos, '}')) return out;

            while (true) {
                if (pos >= text.size()) malformed("array", text);
                if (text[pos] == '{') {
                    out.emplace_back(parse_array_level(text, pos, element));
                } else if (text[pos] == '"') {
                    ++pos;
                    std::string item;
                    while (true) {
                        if (pos >= text.size()) malformed("array", text);
                        char c = text[pos++];
                        if (c == '"') break;
                        if (c == '\\') {
                            if (pos >= text.size()) malformed("array", text);
                            c = text[pos++];
                        }
                        item += c;
                    }
                    out.push_back(decode_text(item, element));
                } else {
                    const auto end = text.find_first_of(",}", pos);
                    if (end == std::string_view::npos) malformed("array", text);
                    const auto item = text.substr(pos, end - pos);
                    pos = end;
                    if (item == "NULL") {
                        out.emplace_back();
                    } else {
                        out.push_back(decode_text(item, element));
                    }
                }

                if (expect(text, pos, ',')) continue;
                if (expect(text, pos, '}')) return out;
                malformed("array", text);
            }
        }

    } // namespace detail

    // Parses {a,b,"c"}, nested {{..},{..}} and the [lo:hi]={...} dimension prefix
    [[nodiscard]] inline wire_array parse_array(std::string_view text, Oid element) {
        std::size_t pos = 0;
        if (!text.empty() && text.front() == '[') {
            pos = text.find('=');
            if (pos == std::string_view::npos) detail::malformed("array", text);
            ++pos;
        }
        auto out = detail::parse_array_level(text, pos, element);
        if (pos != text.size()) detail::malformed("array", text);
        return out;
    }

    // Convert one text-format column value by its type OID; unknown types stay text
    [[nodiscard]] inline wire_value decode_text(std::string_view text, Oid type) {
        switch (type) {
            case oid::boolean:
                if (text == "t" || text == "true") return wire_value(true);
                if (text == "f" || text == "false") return wire_value(false);
                detail::malformed("boolean", text);
            case oid::int2:
            case oid::int4:
            case oid::int8:
            case oid::object_id: {
                std::int64_t v = 0;
                auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
                if (ec != std::errc{} || ptr != text.data() + text.size()) detail::malformed("integer", text);
                return wire_value(v);
            }
            case oid::float4:
            case oid::float8:
            case oid::numeric: {
                if (text == "NaN") return wire_value(std::nan(""));
                if (text == "Infinity") return wire_value(HUGE_VAL);
                if (text == "-Infinity") return wire_value(-HUGE_VAL);
                double v = 0;
                auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
                // numeric beyond double range keeps its exact text
                if (ec == std::errc::result_out_of_range && type == oid::numeric &&
                    ptr == text.data() + text.size()) {
                    return wire_value(text);
                }
                if (ec != std::errc{} || ptr != text.data() + text.size()) detail::malformed("float", text);
                return wire_value(v);
            }
            case oid::bytea:
                return wire_value(parse_bytea(text));
            case oid::date:
                // infinity and BC dates have no calendar representation
                if (text == "infinity" || text == "-infinity" || text.ends_with(" BC")) return wire_value(text);
                return wire_value(parse_date(text));
            case oid::time:
                return wire_value(parse_time(text));
            case oid::timestamp:
            case oid::timestamptz:
                if (text == "infinity" || text == "-infinity" || text.ends_with(" BC")) return wire_value(text);
                return wire_value(parse_timestamp(text));
            default:
                break;
        }
        if (const Oid element = array_element(type); element != oid::unknown) {
            return wire_value(parse_array(text, element));
        }
        return wire_value(text);
    }

} // namespace tessera::pq
