#pragma once

#include "db/idata_source.hpp"
#include "db/idb_connection.hpp"

#include <memory>

namespace sqlmemo {

/**
 * @brief Transaction primitive used by an executor
 *
 * Acquired once per session (or per isolated lazy-load executor) and
 * released by close(). All methods may throw DataAccessError.
 */
class ITransaction {
public:
    virtual ~ITransaction() = default;

    /// Connection of this transaction, opened on first use
    [[nodiscard]] virtual IDbConnection& connection() = 0;

    virtual void commit() = 0;
    virtual void rollback() = 0;
    virtual void close() = 0;
};

/**
 * @brief Creates transactions over a data source
 */
class ITransactionFactory {
public:
    virtual ~ITransactionFactory() = default;

    [[nodiscard]] virtual std::unique_ptr<ITransaction> new_transaction(
        std::shared_ptr<IDataSource> data_source, bool autocommit) = 0;
};

} // namespace sqlmemo
