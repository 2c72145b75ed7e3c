#pragma once

#include "core/types.hpp"
#include "core/value.hpp"
#include "mapping/mapped_statement.hpp"
#include "transaction/itransaction.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sqlmemo {

class Executor;

/**
 * @brief Outcome of one flushed batch
 */
struct BatchResult {
    std::string statement_id;
    std::string sql;
    std::vector<int64_t> update_counts;
};

/**
 * @brief Receives mapped rows one by one instead of a result list
 */
class IResultHandler {
public:
    virtual ~IResultHandler() = default;

    virtual void handle_result(const ObjectPtr& row) = 0;
};

/**
 * @brief Physical fetch primitive
 *
 * Runs a statement on the transaction's connection and maps the rows.
 * The executor passed in is the one driving the call; row mapping uses
 * it to resolve nested selects so they share its memo.
 *
 * Implementations report failures by throwing (DataAccessError for
 * anything the database rejects). They must not touch the memo.
 */
class IStatementBackend {
public:
    virtual ~IStatementBackend() = default;

    /**
     * @brief Fetch and map rows
     * @param handler When set, rows go to the handler and the returned
     *        list is empty
     */
    [[nodiscard]] virtual ResultListPtr query(
        Executor& executor, const MappedStatement& statement, const Value& parameter,
        const RowBounds& bounds, IResultHandler* handler, const BoundSql& bound_sql,
        ITransaction& transaction) = 0;

    /// Run an INSERT / UPDATE / DELETE, returning the affected row count
    virtual int64_t update(
        Executor& executor, const MappedStatement& statement, const Value& parameter,
        const BoundSql& bound_sql, ITransaction& transaction) = 0;

    /// Send buffered writes, or drop them when is_rollback is set
    virtual std::vector<BatchResult> flush_statements(bool is_rollback, ITransaction& transaction) = 0;
};

} // namespace sqlmemo
