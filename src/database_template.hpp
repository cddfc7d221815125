#pragma once

#include "database_error.hpp"
#include "database_value.hpp"
#include <algorithm>
#include <any>
#include <concepts>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

namespace tessera {

    class sql_template;

    // Slot value with no wire representation; rejected by the compiler
    struct invalid_slot {
        std::string type_name;
    };

    using template_slot = std::variant<wire_value, std::shared_ptr<const sql_template>, invalid_slot>;

    // Trusted literal SQL interleaved with value slots.
    // literals().size() == slots().size() + 1 always holds.
    class sql_template {
    public:
        sql_template() : literals_(1) {}

        // Runtime construction; the literal/slot arity is validated here and again when compiled
        [[nodiscard]] static sql_template from_parts(std::vector<std::string> literals,
                                                     std::vector<template_slot> slots) {
            if (literals.size() != slots.size() + 1) {
                throw template_compile_error{
                    "Malformed template: " + std::to_string(literals.size()) +
                    " literal segments for " + std::to_string(slots.size()) + " slots"};
            }
            sql_template t;
            t.literals_ = std::move(literals);
            t.slots_ = std::move(slots);
            return t;
        }

        [[nodiscard]] const std::vector<std::string>& literals() const noexcept {
            return literals_;
        }

        [[nodiscard]] const std::vector<template_slot>& slots() const noexcept {
            return slots_;
        }

        // True when the template contributes neither text nor parameters
        [[nodiscard]] bool empty() const noexcept {
            return slots_.empty() &&
                   std::all_of(literals_.begin(), literals_.end(),
                               [](const std::string& s) { return s.empty(); });
        }

        // Concatenate another template onto this one
        sql_template& append(const sql_template& other) {
            if (&other == this) {
                sql_template copy = other;
                return append(copy);
            }
            if (literals_.empty()) {
                literals_.emplace_back();
            }
            if (other.literals_.empty()) {
                return *this;
            }
            literals_.back() += other.literals_.front();
            slots_.insert(slots_.end(), other.slots_.begin(), other.slots_.end());
            literals_.insert(literals_.end(), other.literals_.begin() + 1, other.literals_.end());
            return *this;
        }

        // Add a nested template as the next slot
        sql_template& append_nested(std::shared_ptr<const sql_template> nested) {
            slots_.emplace_back(std::in_place_type<std::shared_ptr<const sql_template>>, std::move(nested));
            literals_.emplace_back();
            return *this;
        }

        // Add a value as the next slot
        sql_template& append_value(wire_value value) {
            slots_.emplace_back(std::in_place_type<wire_value>, std::move(value));
            literals_.emplace_back();
            return *this;
        }

        friend sql_template operator+(sql_template lhs, const sql_template& rhs) {
            lhs.append(rhs);
            return lhs;
        }

    private:
        std::vector<std::string> literals_;
        std::vector<template_slot> slots_;
    };

    template<typename T>
    concept TemplateArgument =
        SqlParameter<T> ||
        std::same_as<std::remove_cvref_t<T>, sql_template> ||
        std::same_as<std::remove_cvref_t<T>, invalid_slot> ||
        std::convertible_to<T, std::shared_ptr<const sql_template>>;

    namespace detail {

        // Called from a constant expression only to make it ill-formed
        inline void invalid_sql_format(const char*) {}

        // Number of {} placeholders, or -1 for an unbalanced brace
        constexpr std::ptrdiff_t count_placeholders(std::string_view fmt) {
            std::ptrdiff_t count = 0;
            for (std::size_t i = 0; i < fmt.size(); ++i) {
                const bool has_next = i + 1 < fmt.size();
                if (fmt[i] == '{') {
                    if (has_next && fmt[i + 1] == '{') { ++i; continue; }
                    if (has_next && fmt[i + 1] == '}') { ++count; ++i; continue; }
                    return -1;
                }
                if (fmt[i] == '}') {
                    if (has_next && fmt[i + 1] == '}') { ++i; continue; }
                    return -1;
                }
            }
            return count;
        }

        // Split a checked format string into literal segments, unescaping {{ and }}
        inline std::vector<std::string> split_format(std::string_view fmt) {
            std::vector<std::string> literals(1);
            for (std::size_t i = 0; i < fmt.size(); ++i) {
                if (fmt[i] == '{' && i + 1 < fmt.size() && fmt[i + 1] == '}') {
                    literals.emplace_back();
                    ++i;
                } else if ((fmt[i] == '{' || fmt[i] == '}') && i + 1 < fmt.size() && fmt[i + 1] == fmt[i]) {
                    literals.back() += fmt[i];
                    ++i;
                } else {
                    literals.back() += fmt[i];
                }
            }
            return literals;
        }

        template<typename T>
        template_slot make_slot(T&& arg) {
            using U = std::remove_cvref_t<T>;
            using nested_ptr = std::shared_ptr<const sql_template>;
            if constexpr (std::same_as<U, sql_template>) {
                return template_slot(std::in_place_type<nested_ptr>,
                                     std::make_shared<const sql_template>(std::forward<T>(arg)));
            } else if constexpr (std::same_as<U, invalid_slot>) {
                return template_slot(std::in_place_type<invalid_slot>, std::forward<T>(arg));
            } else if constexpr (std::same_as<U, std::nullptr_t>) {
                // nullptr is a NULL value, never a missing nested template
                return template_slot(std::in_place_type<wire_value>);
            } else if constexpr (std::convertible_to<T, nested_ptr>) {
                return template_slot(std::in_place_type<nested_ptr>, nested_ptr(std::forward<T>(arg)));
            } else {
                return template_slot(std::in_place_type<wire_value>, to_wire(arg));
            }
        }

    } // namespace detail

    // Format string whose text must be a constant expression with one {} per argument
    template<typename... Args>
    struct basic_sql_format {
        template<typename S>
        requires std::convertible_to<const S&, std::string_view>
        consteval basic_sql_format(const S& s) : text(s) {
            const auto count = detail::count_placeholders(text);
            if (count < 0) {
                detail::invalid_sql_format("unbalanced brace in SQL format string");
            }
            if (static_cast<std::size_t>(count) != sizeof...(Args)) {
                detail::invalid_sql_format("placeholder count does not match argument count");
            }
        }

        std::string_view text;
    };

    template<typename... Args>
    using sql_format = basic_sql_format<std::type_identity_t<Args>...>;

    // Build a template: sql("SELECT * FROM t WHERE id = {}", id)
    template<TemplateArgument... Args>
    [[nodiscard]] sql_template sql(sql_format<Args...> fmt, Args&&... args) {
        std::vector<template_slot> slots;
        slots.reserve(sizeof...(Args));
        (slots.push_back(detail::make_slot(std::forward<Args>(args))), ...);
        return sql_template::from_parts(detail::split_format(fmt.text), std::move(slots));
    }

    // Slot for a value only known as std::any; unknown types become invalid_slot
    [[nodiscard]] inline template_slot make_dynamic_slot(const std::any& value) {
        using nested_ptr = std::shared_ptr<const sql_template>;
        if (!value.has_value()) return template_slot(std::in_place_type<wire_value>);
        if (value.type() == typeid(std::nullptr_t)) return template_slot(std::in_place_type<wire_value>);
        if (auto v = std::any_cast<wire_value>(&value)) return template_slot(std::in_place_type<wire_value>, *v);
        if (auto v = std::any_cast<bool>(&value)) return template_slot(std::in_place_type<wire_value>, *v);
        if (auto v = std::any_cast<int>(&value)) return template_slot(std::in_place_type<wire_value>, *v);
        if (auto v = std::any_cast<long>(&value)) return template_slot(std::in_place_type<wire_value>, *v);
        if (auto v = std::any_cast<long long>(&value)) return template_slot(std::in_place_type<wire_value>, *v);
        if (auto v = std::any_cast<double>(&value)) return template_slot(std::in_place_type<wire_value>, *v);
        if (auto v = std::any_cast<std::string>(&value)) return template_slot(std::in_place_type<wire_value>, *v);
        if (auto v = std::any_cast<const char*>(&value)) return template_slot(std::in_place_type<wire_value>, to_wire(*v));
        if (auto v = std::any_cast<bytes>(&value)) return template_slot(std::in_place_type<wire_value>, *v);
        if (auto v = std::any_cast<sql_template>(&value)) {
            return template_slot(std::in_place_type<nested_ptr>, std::make_shared<const sql_template>(*v));
        }
        if (auto v = std::any_cast<nested_ptr>(&value)) return template_slot(std::in_place_type<nested_ptr>, *v);
        return template_slot(std::in_place_type<invalid_slot>, invalid_slot{value.type().name()});
    }

    // Flattened statement: $1..$n in text, matching parameters in order
    struct compiled_statement {
        std::string text;
        std::vector<wire_value> parameters;

        bool operator==(const compiled_statement&) const = default;
    };

    // Flattens a template tree depth-first, left to right, with one running
    // placeholder counter for the whole tree
    class template_compiler {
    public:
        [[nodiscard]] compiled_statement compile(const sql_template& tmpl) const {
            compiled_statement out;
            std::vector<const sql_template*> active;
            std::vector<std::size_t> slot_path;
            walk(tmpl, out, active, slot_path);
            return out;
        }

    private:
        static std::string path_string(const std::vector<std::size_t>& path) {
            if (path.empty()) return "<root>";
            std::string s;
            for (std::size_t i = 0; i < path.size(); ++i) {
                if (i > 0) s += '.';
                s += std::to_string(path[i]);
            }
            return s;
        }

        void walk(const sql_template& node,
                  compiled_statement& out,
                  std::vector<const sql_template*>& active,
                  std::vector<std::size_t>& slot_path) const {
            if (std::find(active.begin(), active.end(), &node) != active.end()) {
                throw cyclic_template_error{"Template nests itself at slot " + path_string(slot_path)};
            }

            const auto& literals = node.literals();
            const auto& slots = node.slots();
            if (literals.size() != slots.size() + 1) {
                throw template_compile_error{
                    "Malformed template at slot " + path_string(slot_path) + ": " +
                    std::to_string(literals.size()) + " literal segments for " +
                    std::to_string(slots.size()) + " slots"};
            }

            active.push_back(&node);
            for (std::size_t i = 0; i < slots.size(); ++i) {
                out.text += literals[i];
                slot_path.push_back(i);
                std::visit([&](const auto& slot) {
                    using S = std::decay_t<decltype(slot)>;
                    if constexpr (std::is_same_v<S, wire_value>) {
                        out.text += '$';
                        out.text += std::to_string(out.parameters.size() + 1);
                        out.parameters.push_back(slot);
                    } else if constexpr (std::is_same_v<S, std::shared_ptr<const sql_template>>) {
                        if (!slot) {
                            throw template_compile_error{
                                "Malformed template: null nested template at slot " + path_string(slot_path)};
                        }
                        walk(*slot, out, active, slot_path);
                    } else {
                        static_assert(std::is_same_v<S, invalid_slot>);
                        throw invalid_parameter_type_error{slot_path, slot.type_name};
                    }
                }, slots[i]);
                slot_path.pop_back();
            }
            out.text += literals.back();
            active.pop_back();
        }
    };

    [[nodiscard]] inline compiled_statement compile(const sql_template& tmpl) {
        return template_compiler{}.compile(tmpl);
    }

} // namespace tessera
