#pragma once

#include "db/idb_connection.hpp"
#include "executor/istatement_backend.hpp"

namespace sqlmemo {

/**
 * @brief Statement backend that runs every statement immediately
 *
 * - Binds the non-OUT parameter values positionally
 * - Applies row bounds in memory (skip offset rows, keep limit rows)
 * - Maps each row to a MappedObject of the statement's result type,
 *   column name → property, SQL NULL → null, other cells as text
 * - Resolves nested selects of each row through the executor
 * - For CALLABLE statements copies OUT / INOUT columns of the first row
 *   back into the parameter object
 *
 * No batching: flush_statements() has nothing to send.
 */
class SimpleStatementBackend : public IStatementBackend {
public:
    SimpleStatementBackend() = default;

    [[nodiscard]] ResultListPtr query(
        Executor& executor, const MappedStatement& statement, const Value& parameter,
        const RowBounds& bounds, IResultHandler* handler, const BoundSql& bound_sql,
        ITransaction& transaction) override;

    int64_t update(
        Executor& executor, const MappedStatement& statement, const Value& parameter,
        const BoundSql& bound_sql, ITransaction& transaction) override;

    std::vector<BatchResult> flush_statements(bool is_rollback, ITransaction& transaction) override;

private:
    static DbResultSet execute(const MappedStatement& statement, const BoundSql& bound_sql,
                               ITransaction& transaction);

    static ObjectPtr map_row(const MappedStatement& statement, const DbResultSet& result, size_t row);

    static void apply_output_parameters(const BoundSql& bound_sql, const DbResultSet& result,
                                        const Value& parameter);
};

} // namespace sqlmemo
