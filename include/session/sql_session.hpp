#pragma once

#include "config/configuration.hpp"
#include "core/types.hpp"
#include "core/value.hpp"
#include "executor/executor.hpp"

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace sqlmemo {

/**
 * @brief Unit of work over one executor
 *
 * Looks statements up by id and forwards to the executor. Writes mark
 * the session dirty; commit() / rollback() reach the transaction only
 * when the session is dirty or the call is forced. Closing the session
 * (or destroying it) closes the executor, rolling back uncommitted
 * writes.
 */
class SqlSession {
public:
    SqlSession(std::shared_ptr<const Configuration> configuration,
               std::shared_ptr<Executor> executor,
               bool autocommit);
    ~SqlSession();

    SqlSession(const SqlSession&) = delete;
    SqlSession& operator=(const SqlSession&) = delete;

    // Reads
    ResultListPtr select_list(std::string_view statement_id, const Value& parameter = {},
                              const RowBounds& bounds = {});

    void select(std::string_view statement_id, const Value& parameter, IResultHandler& handler,
                const RowBounds& bounds = {});

    /**
     * @return The single row, or null when there is none
     * @throws ExecutorError(TOO_MANY_RESULTS) for more than one row
     */
    Value select_one(std::string_view statement_id, const Value& parameter = {});

    // Writes (affected row count)
    int64_t insert(std::string_view statement_id, const Value& parameter = {});
    int64_t update(std::string_view statement_id, const Value& parameter = {});
    int64_t remove(std::string_view statement_id, const Value& parameter = {});

    void commit(bool force = false);
    void rollback(bool force = false);
    std::vector<BatchResult> flush_statements();
    void clear_cache();
    void close();

    [[nodiscard]] bool is_dirty() const { return dirty_; }
    [[nodiscard]] Executor& executor() { return *executor_; }
    [[nodiscard]] const std::shared_ptr<Executor>& executor_ptr() const { return executor_; }
    [[nodiscard]] const Configuration& configuration() const { return *configuration_; }

private:
    [[nodiscard]] bool is_commit_or_rollback_required(bool force) const {
        return (!autocommit_ && dirty_) || force;
    }

    std::shared_ptr<const Configuration> configuration_;
    std::shared_ptr<Executor> executor_;
    bool autocommit_;
    bool dirty_ = false;
};

} // namespace sqlmemo
