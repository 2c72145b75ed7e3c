#pragma once

#include "core/value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sqlmemo {

/**
 * @brief Result set from a statement execution
 *
 * Returned by IDbConnection::execute(). Owns the result data (copied
 * from native result handles). SQL NULL cells are std::nullopt.
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;

    // For SELECT
    std::vector<std::string> column_names;
    std::vector<std::vector<std::optional<std::string>>> rows;

    // For DML
    uint64_t affected_rows = 0;

    // SELECT vs DML/DDL
    bool has_rows = false;

    /// Column position by name, -1 when absent
    [[nodiscard]] int column_index(const std::string& name) const {
        for (size_t i = 0; i < column_names.size(); ++i) {
            if (column_names[i] == name) return static_cast<int>(i);
        }
        return -1;
    }
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle. Implementations are not
 * thread-safe; a connection belongs to one transaction.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a SQL statement with positional parameters
     * @param sql SQL text with backend-specific placeholders
     * @param parameters Scalar values, null binds SQL NULL
     * @return Result set with rows or affected count
     */
    [[nodiscard]] virtual DbResultSet execute(
        const std::string& sql, const std::vector<Value>& parameters) = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace sqlmemo
