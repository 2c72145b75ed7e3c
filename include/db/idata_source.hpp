#pragma once

#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace sqlmemo {

/**
 * @brief Source of new database connections
 *
 * Each backend provides its own data source that wraps the native
 * connection function (PQconnectdb, ...). No pooling.
 */
class IDataSource {
public:
    virtual ~IDataSource() = default;

    /**
     * @brief Open a new connection
     * @throws DataAccessError when the connection cannot be established
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> get_connection() = 0;

    /// Human-readable target for logs (never includes credentials)
    [[nodiscard]] virtual std::string describe() const = 0;
};

} // namespace sqlmemo
