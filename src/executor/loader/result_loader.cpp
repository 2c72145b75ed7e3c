#include "executor/loader/result_loader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "executor/executor.hpp"
#include "executor/result_extractor.hpp"

#include <format>

namespace sqlmemo {

ResultLoader::ResultLoader(std::shared_ptr<const Configuration> configuration,
                           std::weak_ptr<Executor> executor,
                           std::shared_ptr<const MappedStatement> statement,
                           Value parameter,
                           TargetType target_type,
                           CacheKey key,
                           BoundSql bound_sql)
    : configuration_(std::move(configuration)),
      executor_(std::move(executor)),
      statement_(std::move(statement)),
      parameter_(std::move(parameter)),
      target_type_(target_type),
      key_(std::move(key)),
      bound_sql_(std::move(bound_sql)),
      creator_thread_(std::this_thread::get_id()) {}

Value ResultLoader::load_result() {
    auto value = extract_object_from_list(select_list(), target_type_);
    was_null_ = is_null(value);
    return value;
}

ResultListPtr ResultLoader::select_list() {
    // The session executor is only looked at from the thread that owns it
    std::shared_ptr<Executor> executor;
    if (std::this_thread::get_id() == creator_thread_) {
        executor = executor_.lock();
        if (executor && executor->is_closed()) executor.reset();
    }
    std::shared_ptr<Executor> isolated;
    if (!executor) {
        isolated = new_executor();
        executor = isolated;
    }

    ResultListPtr list;
    try {
        list = executor->query(*statement_, parameter_, RowBounds{}, nullptr, key_, bound_sql_);
    } catch (...) {
        if (isolated) isolated->close(false);
        throw;
    }
    if (isolated) isolated->close(false);
    return list;
}

std::shared_ptr<Executor> ResultLoader::new_executor() const {
    const auto* environment = configuration_ ? configuration_->environment() : nullptr;
    if (!environment) {
        throw ExecutorError(ErrorCode::MISCONFIGURED_ENVIRONMENT,
            "ResultLoader could not load lazily. Environment was not configured.");
    }
    if (!environment->data_source) {
        throw ExecutorError(ErrorCode::MISCONFIGURED_ENVIRONMENT,
            "ResultLoader could not load lazily. DataSource was not configured.");
    }
    if (!environment->transaction_factory) {
        throw ExecutorError(ErrorCode::MISCONFIGURED_ENVIRONMENT,
            "ResultLoader could not load lazily. TransactionFactory was not configured.");
    }

    utils::log::debug(std::format("ResultLoader: isolated executor for '{}' on {}",
                                  statement_->id, environment->data_source->describe()));
    auto transaction = environment->transaction_factory->new_transaction(environment->data_source, false);
    return Executor::create(configuration_, std::move(transaction));
}

} // namespace sqlmemo
