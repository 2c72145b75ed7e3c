#include "executor/simple_statement_backend.hpp"
#include "core/error.hpp"
#include "core/mapped_object.hpp"
#include "executor/executor.hpp"
#include "executor/loader/nested_query_resolver.hpp"
#include "reflection/meta_object.hpp"

#include <algorithm>
#include <format>

namespace sqlmemo {

namespace {

Value cell_value(const std::optional<std::string>& cell) {
    if (!cell) return {};
    return *cell;
}

} // anonymous namespace

DbResultSet SimpleStatementBackend::execute(const MappedStatement& statement, const BoundSql& bound_sql,
                                            ITransaction& transaction) {
    auto result = transaction.connection().execute(bound_sql.sql(), bound_sql.input_values());
    if (!result.success) {
        throw DataAccessError(std::format("Error executing '{}': {}", statement.id, result.error_message));
    }
    return result;
}

ResultListPtr SimpleStatementBackend::query(
    Executor& executor, const MappedStatement& statement, const Value& parameter,
    const RowBounds& bounds, IResultHandler* handler, const BoundSql& bound_sql,
    ITransaction& transaction) {

    const auto result = execute(statement, bound_sql, transaction);
    auto list = std::make_shared<ResultList>();

    const size_t total = result.rows.size();
    const size_t first = static_cast<size_t>(std::max<int64_t>(bounds.offset, 0));
    const size_t limit = static_cast<size_t>(std::max<int64_t>(bounds.limit, 0));
    const size_t last = first < total ? first + std::min(limit, total - first) : first;

    NestedQueryResolver resolver(executor);
    for (size_t i = first; i < last && i < total; ++i) {
        auto row = map_row(statement, result, i);
        for (const auto& nested : statement.nested_selects) {
            const auto column = result.column_index(nested.column);
            const Value nested_parameter = column >= 0 ? cell_value(result.rows[i][static_cast<size_t>(column)])
                                                       : Value{};
            resolver.resolve(row, nested, nested_parameter);
        }
        if (handler) {
            handler->handle_result(row);
        } else {
            list->push_back(std::move(row));
        }
    }

    if (statement.is_callable()) {
        apply_output_parameters(bound_sql, result, parameter);
    }
    return list;
}

int64_t SimpleStatementBackend::update(
    Executor& /*executor*/, const MappedStatement& statement, const Value& parameter,
    const BoundSql& bound_sql, ITransaction& transaction) {

    const auto result = execute(statement, bound_sql, transaction);
    if (statement.is_callable()) {
        apply_output_parameters(bound_sql, result, parameter);
    }
    return static_cast<int64_t>(result.affected_rows);
}

std::vector<BatchResult> SimpleStatementBackend::flush_statements(bool /*is_rollback*/,
                                                                  ITransaction& /*transaction*/) {
    return {};
}

ObjectPtr SimpleStatementBackend::map_row(const MappedStatement& statement, const DbResultSet& result,
                                          size_t row) {
    auto object = MappedObject::create(statement.result_type);
    const auto& cells = result.rows[row];
    const size_t columns = std::min(cells.size(), result.column_names.size());
    for (size_t c = 0; c < columns; ++c) {
        object->set_value(result.column_names[c], cell_value(cells[c]));
    }
    return object;
}

void SimpleStatementBackend::apply_output_parameters(const BoundSql& bound_sql, const DbResultSet& result,
                                                     const Value& parameter) {
    const auto* target = std::get_if<ObjectPtr>(&parameter);
    if (!target || !*target || result.rows.empty()) return;

    MetaObject meta(*target);
    const auto& first_row = result.rows.front();
    for (const auto& mapping : bound_sql.parameter_mappings()) {
        if (mapping.mode == ParameterMode::IN) continue;
        const auto column = result.column_index(mapping.property);
        if (column < 0 || static_cast<size_t>(column) >= first_row.size()) continue;
        meta.set_value(mapping.property, cell_value(first_row[static_cast<size_t>(column)]));
    }
}

} // namespace sqlmemo
