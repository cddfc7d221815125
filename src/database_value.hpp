#pragma once

#include "database_error.hpp"
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace tessera {

    // SQL NULL
    struct null_value {
        bool operator==(const null_value&) const = default;
    };

    using bytes = std::vector<std::byte>;
    using date = std::chrono::year_month_day;
    using time_of_day = std::chrono::microseconds;
    using timestamp = std::chrono::sys_time<std::chrono::microseconds>;

    // Order matches the alternatives of wire_value::storage
    enum class wire_kind {
        null,
        boolean,
        integer,
        floating,
        text,
        bytes,
        date,
        time,
        timestamp,
        array
    };

    [[nodiscard]] constexpr std::string_view kind_name(wire_kind kind) noexcept {
        switch (kind) {
            case wire_kind::null: return "null";
            case wire_kind::boolean: return "boolean";
            case wire_kind::integer: return "integer";
            case wire_kind::floating: return "float";
            case wire_kind::text: return "text";
            case wire_kind::bytes: return "bytes";
            case wire_kind::date: return "date";
            case wire_kind::time: return "time";
            case wire_kind::timestamp: return "timestamp";
            case wire_kind::array: return "array";
        }
        return "unknown";
    }

    namespace detail {

        // Integer types that map to the integer wire kind; character types do not
        template<typename T>
        concept sql_integer = std::integral<T> &&
            !std::same_as<T, bool> && !std::same_as<T, char> && !std::same_as<T, wchar_t> &&
            !std::same_as<T, char8_t> && !std::same_as<T, char16_t> && !std::same_as<T, char32_t>;

    } // namespace detail

    struct wire_value;
    using wire_array = std::vector<wire_value>;

    // A single value as it travels to or from the server
    struct wire_value {
        using storage = std::variant<null_value, bool, std::int64_t, double, std::string,
                                     bytes, date, time_of_day, timestamp, wire_array>;

        wire_value() noexcept = default;
        wire_value(null_value) noexcept {}
        wire_value(std::nullptr_t) noexcept {}
        wire_value(bool v) : data_(v) {}

        template<detail::sql_integer I>
        wire_value(I v) : data_(static_cast<std::int64_t>(v)) {}

        template<std::floating_point F>
        wire_value(F v) : data_(static_cast<double>(v)) {}

        wire_value(const char* v) : data_(std::string(v)) {}
        wire_value(std::string_view v) : data_(std::string(v)) {}
        wire_value(std::string v) : data_(std::move(v)) {}
        wire_value(bytes v) : data_(std::move(v)) {}
        wire_value(date v) : data_(v) {}
        wire_value(time_of_day v) : data_(v) {}
        wire_value(timestamp v) : data_(v) {}
        wire_value(wire_array v) : data_(std::move(v)) {}

        [[nodiscard]] wire_kind kind() const noexcept {
            return static_cast<wire_kind>(data_.index());
        }

        [[nodiscard]] bool is_null() const noexcept {
            return std::holds_alternative<null_value>(data_);
        }

        template<typename T>
        [[nodiscard]] const T* get_if() const noexcept {
            return std::get_if<T>(&data_);
        }

        [[nodiscard]] const storage& data() const noexcept {
            return data_;
        }

        bool operator==(const wire_value&) const = default;

    private:
        storage data_;
    };

    namespace detail {

        [[noreturn]] inline void coercion_failure(const wire_value& value, std::string_view target) {
            if (value.is_null()) {
                throw mapping_error("null value for non-nullable " + std::string(target));
            }
            throw mapping_error("cannot coerce " + std::string(kind_name(value.kind())) +
                                " value to " + std::string(target));
        }

    } // namespace detail

    // Conversions between C++ types and wire values.
    // to_wire: the type can be bound as a parameter.
    // from_wire: the type can receive a column value (the coercion table).
    template<typename T>
    struct value_traits {};

    template<typename T>
    concept SqlParameter = requires(const T& v) {
        { value_traits<std::remove_cvref_t<T>>::to_wire(v) } -> std::same_as<wire_value>;
    };

    template<typename T>
    concept WireDecodable = requires(const wire_value& w) {
        { value_traits<T>::from_wire(w) } -> std::same_as<T>;
    };

    template<>
    struct value_traits<wire_value> {
        static wire_value to_wire(const wire_value& v) { return v; }
        static wire_value from_wire(const wire_value& w) { return w; }
    };

    template<>
    struct value_traits<null_value> {
        static wire_value to_wire(const null_value&) { return wire_value{}; }
    };

    template<>
    struct value_traits<std::nullptr_t> {
        static wire_value to_wire(const std::nullptr_t&) { return wire_value{}; }
    };

    template<>
    struct value_traits<bool> {
        static wire_value to_wire(const bool& v) { return wire_value(v); }

        static bool from_wire(const wire_value& w) {
            if (auto v = w.get_if<bool>()) return *v;
            detail::coercion_failure(w, "boolean");
        }
    };

    template<detail::sql_integer T>
    struct value_traits<T> {
        static wire_value to_wire(const T& v) {
            if (!std::in_range<std::int64_t>(v)) {
                throw template_compile_error{
                    "Integer parameter " + std::to_string(v) + " does not fit a 64-bit integer"};
            }
            return wire_value(static_cast<std::int64_t>(v));
        }

        static T from_wire(const wire_value& w) {
            if (auto v = w.get_if<std::int64_t>()) {
                if (!std::in_range<T>(*v)) {
                    throw mapping_error("integer " + std::to_string(*v) + " out of range for target type");
                }
                return static_cast<T>(*v);
            }
            detail::coercion_failure(w, "integer");
        }
    };

    template<std::floating_point T>
    struct value_traits<T> {
        static wire_value to_wire(const T& v) { return wire_value(static_cast<double>(v)); }

        // Integers widen to floating point; the reverse is not allowed
        static T from_wire(const wire_value& w) {
            if (auto v = w.get_if<double>()) return static_cast<T>(*v);
            if (auto v = w.get_if<std::int64_t>()) return static_cast<T>(*v);
            detail::coercion_failure(w, "floating point");
        }
    };

    template<>
    struct value_traits<std::string> {
        static wire_value to_wire(const std::string& v) { return wire_value(v); }

        static std::string from_wire(const wire_value& w) {
            if (auto v = w.get_if<std::string>()) return *v;
            detail::coercion_failure(w, "text");
        }
    };

    template<>
    struct value_traits<std::string_view> {
        static wire_value to_wire(const std::string_view& v) { return wire_value(v); }
    };

    template<>
    struct value_traits<const char*> {
        static wire_value to_wire(const char* const& v) {
            return v ? wire_value(v) : wire_value{};
        }
    };

    template<>
    struct value_traits<char*> {
        static wire_value to_wire(char* const& v) {
            return v ? wire_value(static_cast<const char*>(v)) : wire_value{};
        }
    };

    template<std::size_t N>
    struct value_traits<char[N]> {
        static wire_value to_wire(const char (&v)[N]) { return wire_value(static_cast<const char*>(v)); }
    };

    template<>
    struct value_traits<bytes> {
        static wire_value to_wire(const bytes& v) { return wire_value(v); }

        static bytes from_wire(const wire_value& w) {
            if (auto v = w.get_if<bytes>()) return *v;
            detail::coercion_failure(w, "bytes");
        }
    };

    template<>
    struct value_traits<date> {
        static wire_value to_wire(const date& v) { return wire_value(v); }

        static date from_wire(const wire_value& w) {
            if (auto v = w.get_if<date>()) return *v;
            detail::coercion_failure(w, "date");
        }
    };

    template<>
    struct value_traits<time_of_day> {
        static wire_value to_wire(const time_of_day& v) { return wire_value(v); }

        static time_of_day from_wire(const wire_value& w) {
            if (auto v = w.get_if<time_of_day>()) return *v;
            detail::coercion_failure(w, "time");
        }
    };

    template<typename Duration>
    struct value_traits<std::chrono::time_point<std::chrono::system_clock, Duration>> {
        using time_point = std::chrono::time_point<std::chrono::system_clock, Duration>;

        static wire_value to_wire(const time_point& v) {
            return wire_value(std::chrono::time_point_cast<std::chrono::microseconds>(v));
        }

        // A date widens to midnight of that day
        static time_point from_wire(const wire_value& w) {
            if (auto v = w.get_if<timestamp>()) {
                return std::chrono::floor<Duration>(*v);
            }
            if (auto v = w.get_if<date>()) {
                return std::chrono::floor<Duration>(std::chrono::sys_days{*v});
            }
            detail::coercion_failure(w, "timestamp");
        }
    };

    template<typename T>
    struct value_traits<std::optional<T>> {
        static wire_value to_wire(const std::optional<T>& v)
        requires SqlParameter<T> {
            if (!v) return wire_value{};
            return value_traits<T>::to_wire(*v);
        }

        static std::optional<T> from_wire(const wire_value& w)
        requires WireDecodable<T> {
            if (w.is_null()) return std::nullopt;
            return value_traits<T>::from_wire(w);
        }
    };

    template<typename T>
    requires (!std::same_as<T, std::byte>)
    struct value_traits<std::vector<T>> {
        static wire_value to_wire(const std::vector<T>& v)
        requires SqlParameter<T> {
            wire_array elements;
            elements.reserve(v.size());
            for (const auto& item : v) {
                elements.push_back(value_traits<T>::to_wire(item));
            }
            return wire_value(std::move(elements));
        }

        static std::vector<T> from_wire(const wire_value& w)
        requires WireDecodable<T> {
            auto elements = w.get_if<wire_array>();
            if (!elements) {
                detail::coercion_failure(w, "array");
            }
            std::vector<T> out;
            out.reserve(elements->size());
            for (std::size_t i = 0; i < elements->size(); ++i) {
                try {
                    out.push_back(value_traits<T>::from_wire((*elements)[i]));
                } catch (const mapping_error& e) {
                    throw mapping_error("array element " + std::to_string(i) + ": " + e.reason);
                }
            }
            return out;
        }
    };

    // Convert any bindable value to its wire form
    template<SqlParameter T>
    [[nodiscard]] wire_value to_wire(const T& value) {
        return value_traits<std::remove_cvref_t<T>>::to_wire(value);
    }

    // Convert a wire value to T using the coercion table
    template<WireDecodable T>
    [[nodiscard]] T from_wire(const wire_value& value) {
        return value_traits<T>::from_wire(value);
    }

} // namespace tessera
