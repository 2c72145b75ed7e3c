#include "session/sql_session.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "executor/result_extractor.hpp"

#include <format>

namespace sqlmemo {

SqlSession::SqlSession(std::shared_ptr<const Configuration> configuration,
                       std::shared_ptr<Executor> executor,
                       bool autocommit)
    : configuration_(std::move(configuration)),
      executor_(std::move(executor)),
      autocommit_(autocommit) {
    if (!configuration_ || !executor_) {
        throw ExecutorError(ErrorCode::CONFIG_ERROR, "SqlSession requires a configuration and an executor");
    }
}

SqlSession::~SqlSession() {
    try {
        close();
    } catch (const std::exception& e) {
        utils::log::warn(std::format("SqlSession: close during destruction failed: {}", e.what()));
    }
}

// ============================================================================
// Reads
// ============================================================================

ResultListPtr SqlSession::select_list(std::string_view statement_id, const Value& parameter,
                                      const RowBounds& bounds) {
    const auto statement = configuration_->statement(statement_id);
    return executor_->query(*statement, parameter, bounds);
}

void SqlSession::select(std::string_view statement_id, const Value& parameter, IResultHandler& handler,
                        const RowBounds& bounds) {
    const auto statement = configuration_->statement(statement_id);
    executor_->query(*statement, parameter, bounds, &handler);
}

Value SqlSession::select_one(std::string_view statement_id, const Value& parameter) {
    return extract_object_from_list(select_list(statement_id, parameter), TargetType::OBJECT);
}

// ============================================================================
// Writes
// ============================================================================

int64_t SqlSession::update(std::string_view statement_id, const Value& parameter) {
    const auto statement = configuration_->statement(statement_id);
    dirty_ = true;
    return executor_->update(*statement, parameter);
}

int64_t SqlSession::insert(std::string_view statement_id, const Value& parameter) {
    return update(statement_id, parameter);
}

int64_t SqlSession::remove(std::string_view statement_id, const Value& parameter) {
    return update(statement_id, parameter);
}

// ============================================================================
// Lifecycle
// ============================================================================

void SqlSession::commit(bool force) {
    executor_->commit(is_commit_or_rollback_required(force));
    dirty_ = false;
}

void SqlSession::rollback(bool force) {
    executor_->rollback(is_commit_or_rollback_required(force));
    dirty_ = false;
}

std::vector<BatchResult> SqlSession::flush_statements() {
    return executor_->flush_statements();
}

void SqlSession::clear_cache() {
    executor_->clear_local_cache();
}

void SqlSession::close() {
    if (executor_->is_closed()) return;
    executor_->close(is_commit_or_rollback_required(false));
    dirty_ = false;
}

} // namespace sqlmemo
