#pragma once

#include "database_error.hpp"
#include "database_value.hpp"
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace tessera {

    // One result row: column names shared with the owning result_set, values in column order
    class row {
    public:
        row(std::shared_ptr<const std::vector<std::string>> columns, std::vector<wire_value> values)
            : columns_(std::move(columns)), values_(std::move(values)) {}

        [[nodiscard]] std::size_t size() const noexcept {
            return values_.size();
        }

        [[nodiscard]] const std::string& column_name(std::size_t col) const {
            return columns_->at(col);
        }

        [[nodiscard]] const wire_value& operator[](std::size_t col) const {
            return values_.at(col);
        }

        // First column with exactly this name, or nullptr
        [[nodiscard]] const wire_value* find(std::string_view name) const noexcept {
            for (std::size_t i = 0; i < columns_->size() && i < values_.size(); ++i) {
                if ((*columns_)[i] == name) {
                    return &values_[i];
                }
            }
            return nullptr;
        }

        template<WireDecodable T>
        [[nodiscard]] T get(std::string_view name) const {
            const wire_value* value = find(name);
            if (!value) {
                throw mapping_error("no column named '" + std::string(name) + "'");
            }
            return value_traits<T>::from_wire(*value);
        }

        [[nodiscard]] const std::vector<wire_value>& values() const noexcept {
            return values_;
        }

    private:
        std::shared_ptr<const std::vector<std::string>> columns_;
        std::vector<wire_value> values_;
    };

    // Rows returned by one statement, plus its command status
    class result_set {
    public:
        result_set()
            : columns_(std::make_shared<const std::vector<std::string>>()) {}

        explicit result_set(std::vector<std::string> columns,
                            std::string command_tag = {},
                            std::uint64_t affected_rows = 0)
            : columns_(std::make_shared<const std::vector<std::string>>(std::move(columns))),
              command_tag_(std::move(command_tag)),
              affected_rows_(affected_rows) {}

        void add_row(std::vector<wire_value> values) {
            if (values.size() != columns_->size()) {
                throw wire_error{"Row has " + std::to_string(values.size()) + " values for " +
                                 std::to_string(columns_->size()) + " columns"};
            }
            rows_.emplace_back(columns_, std::move(values));
        }

        [[nodiscard]] std::size_t row_count() const noexcept {
            return rows_.size();
        }

        [[nodiscard]] std::size_t column_count() const noexcept {
            return columns_->size();
        }

        [[nodiscard]] bool empty() const noexcept {
            return rows_.empty();
        }

        [[nodiscard]] const std::vector<std::string>& columns() const noexcept {
            return *columns_;
        }

        [[nodiscard]] const row& operator[](std::size_t index) const {
            return rows_.at(index);
        }

        [[nodiscard]] auto begin() const noexcept { return rows_.begin(); }
        [[nodiscard]] auto end() const noexcept { return rows_.end(); }

        // Status tag reported by the server, e.g. "UPDATE 3"
        [[nodiscard]] const std::string& command_tag() const noexcept {
            return command_tag_;
        }

        [[nodiscard]] std::uint64_t affected_rows() const noexcept {
            return affected_rows_;
        }

    private:
        std::shared_ptr<const std::vector<std::string>> columns_;
        std::vector<row> rows_;
        std::string command_tag_;
        std::uint64_t affected_rows_ = 0;
    };

    // Binds a column name to a data member of a record
    template<typename Record, typename Member>
    struct field_descriptor {
        std::string_view name;
        Member Record::* member;
    };

    template<typename Record, typename Member>
    [[nodiscard]] constexpr field_descriptor<Record, Member> field(std::string_view name,
                                                                  Member Record::* member) noexcept {
        return {name, member};
    }

    // Specialize with `static constexpr auto fields = std::make_tuple(field("id", &T::id), ...);`
    template<typename T>
    struct record_shape {};

    template<typename T>
    concept MappableRecord = std::default_initializable<T> && requires {
        std::tuple_size<std::remove_cvref_t<decltype(record_shape<T>::fields)>>::value;
    };

    template<typename T>
    concept Mappable = MappableRecord<T> || WireDecodable<T>;

    namespace detail {

        template<typename T>
        struct is_optional : std::false_type {};

        template<typename T>
        struct is_optional<std::optional<T>> : std::true_type {};

    } // namespace detail

    // Converts rows into records or scalars, preserving row order
    class result_mapper {
    public:
        template<Mappable T>
        [[nodiscard]] static T map_row(const row& r, std::size_t index) {
            if constexpr (MappableRecord<T>) {
                T record{};
                std::apply([&](const auto&... fields) {
                    (assign_field(record, r, index, fields), ...);
                }, record_shape<T>::fields);
                return record;
            } else {
                if (r.size() != 1) {
                    throw cardinality_error{
                        "Expected exactly one column for a scalar result, got " + std::to_string(r.size())};
                }
                try {
                    return value_traits<T>::from_wire(r[0]);
                } catch (const mapping_error& e) {
                    throw mapping_error(index, r.column_name(0), "<value>", e.reason);
                }
            }
        }

        template<Mappable T>
        [[nodiscard]] static std::vector<T> map(const result_set& rows) {
            std::vector<T> out;
            out.reserve(rows.row_count());
            for (std::size_t i = 0; i < rows.row_count(); ++i) {
                out.push_back(map_row<T>(rows[i], i));
            }
            return out;
        }

        // No value for zero rows; more than one row is an error
        template<Mappable T>
        [[nodiscard]] static std::optional<T> map_single_row(const result_set& rows) {
            if (rows.row_count() > 1) {
                throw cardinality_error{
                    "Expected at most one row, got " + std::to_string(rows.row_count())};
            }
            if (rows.empty()) {
                return std::nullopt;
            }
            return map_row<T>(rows[0], 0);
        }

        // Exactly one row with exactly one column
        template<WireDecodable T>
        [[nodiscard]] static T map_value(const result_set& rows) {
            if (rows.row_count() != 1 || rows.column_count() != 1) {
                throw cardinality_error{
                    "Expected a single value, got " + std::to_string(rows.row_count()) + " rows of " +
                    std::to_string(rows.column_count()) + " columns"};
            }
            try {
                return value_traits<T>::from_wire(rows[0][0]);
            } catch (const mapping_error& e) {
                throw mapping_error(0, rows.columns()[0], "<value>", e.reason);
            }
        }

    private:
        template<typename Record, typename Member>
        static void assign_field(Record& record, const row& r, std::size_t index,
                                 const field_descriptor<Record, Member>& f) {
            static_assert(WireDecodable<Member>, "record field type has no wire conversion");

            const wire_value* value = r.find(f.name);
            if (!value) {
                // Optional fields may be absent from the result
                if constexpr (detail::is_optional<Member>::value) {
                    record.*(f.member) = std::nullopt;
                    return;
                } else {
                    throw mapping_error(index, std::string(f.name), std::string(f.name),
                                        "no matching column for required field");
                }
            }

            try {
                record.*(f.member) = value_traits<Member>::from_wire(*value);
            } catch (const mapping_error& e) {
                throw mapping_error(index, std::string(f.name), std::string(f.name), e.reason);
            }
        }
    };

} // namespace tessera
