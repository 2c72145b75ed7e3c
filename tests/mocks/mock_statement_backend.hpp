#pragma once

#include "core/mapped_object.hpp"
#include "executor/istatement_backend.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sqlmemo::testing {

/**
 * @brief Physical fetch primitive with call counting
 *
 * By default a query returns one row of the statement's result type
 * carrying the statement id and the first bound value. Hooks replace
 * the default behaviour per test.
 */
class MockStatementBackend : public IStatementBackend {
public:
    using QueryHook = std::function<ResultListPtr(
        Executor&, const MappedStatement&, const Value&, const RowBounds&, IResultHandler*, const BoundSql&)>;
    using UpdateHook = std::function<int64_t(Executor&, const MappedStatement&, const Value&)>;

    [[nodiscard]] ResultListPtr query(
        Executor& executor, const MappedStatement& statement, const Value& parameter,
        const RowBounds& bounds, IResultHandler* handler, const BoundSql& bound_sql,
        ITransaction& /*transaction*/) override {
        QueryHook hook;
        {
            std::lock_guard lock(mutex_);
            ++query_count_;
            ++queries_by_statement_[statement.id];
            hook = on_query_;
        }
        if (hook) return hook(executor, statement, parameter, bounds, handler, bound_sql);

        auto row = MappedObject::create(statement.result_type);
        row->set_value("statement", statement.id);
        const auto inputs = bound_sql.input_values();
        if (!inputs.empty()) row->set_value("param", inputs.front());
        if (handler) {
            handler->handle_result(row);
            return std::make_shared<ResultList>();
        }
        return std::make_shared<ResultList>(ResultList{row});
    }

    int64_t update(
        Executor& executor, const MappedStatement& statement, const Value& parameter,
        const BoundSql& /*bound_sql*/, ITransaction& /*transaction*/) override {
        UpdateHook hook;
        {
            std::lock_guard lock(mutex_);
            ++update_count_;
            hook = on_update_;
        }
        return hook ? hook(executor, statement, parameter) : 1;
    }

    std::vector<BatchResult> flush_statements(bool is_rollback, ITransaction& /*transaction*/) override {
        std::lock_guard lock(mutex_);
        ++flush_count_;
        last_flush_was_rollback_ = is_rollback;
        return {};
    }

    void set_on_query(QueryHook hook) {
        std::lock_guard lock(mutex_);
        on_query_ = std::move(hook);
    }

    void set_on_update(UpdateHook hook) {
        std::lock_guard lock(mutex_);
        on_update_ = std::move(hook);
    }

    [[nodiscard]] size_t query_count() const {
        std::lock_guard lock(mutex_);
        return query_count_;
    }

    [[nodiscard]] size_t query_count(const std::string& statement_id) const {
        std::lock_guard lock(mutex_);
        const auto it = queries_by_statement_.find(statement_id);
        return it != queries_by_statement_.end() ? it->second : 0;
    }

    [[nodiscard]] size_t update_count() const {
        std::lock_guard lock(mutex_);
        return update_count_;
    }

    [[nodiscard]] size_t flush_count() const {
        std::lock_guard lock(mutex_);
        return flush_count_;
    }

    [[nodiscard]] bool last_flush_was_rollback() const {
        std::lock_guard lock(mutex_);
        return last_flush_was_rollback_;
    }

private:
    mutable std::mutex mutex_;
    QueryHook on_query_;
    UpdateHook on_update_;
    size_t query_count_ = 0;
    size_t update_count_ = 0;
    size_t flush_count_ = 0;
    bool last_flush_was_rollback_ = false;
    std::map<std::string, size_t> queries_by_statement_;
};

} // namespace sqlmemo::testing
