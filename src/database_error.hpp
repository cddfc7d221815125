#pragma once

#include <cstddef>
#include <source_location>
#include <stdexcept>
#include <string>
#include <vector>

namespace tessera {

    // Base error type for every failure raised by tessera
    struct database_error : public std::runtime_error {
        std::string sql_state;
        std::source_location location;

        database_error(std::string msg, std::string state = "",
                      std::source_location loc = std::source_location::current())
            : std::runtime_error(msg), sql_state(std::move(state)), location(loc) {}

        std::string message() const { return what(); }
    };

    // Malformed connection string or inconsistent pool settings
    struct configuration_error : public database_error {
        using database_error::database_error;
    };

    // Template could not be flattened into a statement
    struct template_compile_error : public database_error {
        using database_error::database_error;
    };

    // A slot holds a value that has no wire representation
    struct invalid_parameter_type_error : public template_compile_error {
        std::vector<std::size_t> slot_path;
        std::string type_name;

        invalid_parameter_type_error(std::vector<std::size_t> path, std::string type,
                                     std::source_location loc = std::source_location::current())
            : template_compile_error(describe(path, type), "", loc),
              slot_path(std::move(path)), type_name(std::move(type)) {}

    private:
        static std::string describe(const std::vector<std::size_t>& path, const std::string& type) {
            std::string where;
            for (std::size_t i = 0; i < path.size(); ++i) {
                if (i > 0) where += '.';
                where += std::to_string(path[i]);
            }
            return "Unsupported parameter type '" + type + "' in template slot " + where;
        }
    };

    // A template contains itself, directly or through nested templates
    struct cyclic_template_error : public template_compile_error {
        using template_compile_error::template_compile_error;
    };

    // Result had a different number of rows or columns than the call requires
    struct cardinality_error : public database_error {
        using database_error::database_error;
    };

    // A row could not be converted into the requested type
    struct mapping_error : public database_error {
        std::size_t row_index = 0;
        std::string column;
        std::string field;
        std::string reason;

        explicit mapping_error(std::string why,
                               std::source_location loc = std::source_location::current())
            : database_error("Mapping failed: " + why, "", loc), reason(std::move(why)) {}

        mapping_error(std::size_t row, std::string column_name, std::string field_name, std::string why,
                      std::source_location loc = std::source_location::current())
            : database_error("Mapping failed at row " + std::to_string(row) + ", column '" +
                             column_name + "' -> field '" + field_name + "': " + why, "", loc),
              row_index(row), column(std::move(column_name)), field(std::move(field_name)),
              reason(std::move(why)) {}
    };

    // A second statement was started while one is still outstanding
    struct connection_busy_error : public database_error {
        using database_error::database_error;
    };

    // Operation not allowed in the current transaction or connection state
    struct illegal_state_error : public database_error {
        using database_error::database_error;
    };

    // Deadline exceeded while acquiring a connection or running a statement
    struct timeout_error : public database_error {
        using database_error::database_error;
    };

    // The caller requested cancellation while waiting
    struct operation_cancelled_error : public database_error {
        using database_error::database_error;
    };

    // The pool no longer hands out connections
    struct pool_closed_error : public database_error {
        using database_error::database_error;
    };

    // Failure reported by the server or the network link
    struct wire_error : public database_error {
        using database_error::database_error;
    };

} // namespace tessera
