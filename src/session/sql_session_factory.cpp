#include "session/sql_session_factory.hpp"
#include "core/error.hpp"
#include "executor/executor.hpp"

namespace sqlmemo {

SqlSessionFactory::SqlSessionFactory(std::shared_ptr<Configuration> configuration)
    : configuration_(std::move(configuration)) {
    if (!configuration_) {
        throw ExecutorError(ErrorCode::CONFIG_ERROR, "SqlSessionFactory requires a configuration");
    }
}

std::unique_ptr<SqlSession> SqlSessionFactory::open_session() {
    return open_session(configuration_->settings().autocommit);
}

std::unique_ptr<SqlSession> SqlSessionFactory::open_session(bool autocommit) {
    const auto* environment = configuration_->environment();
    if (!environment) {
        throw ExecutorError(ErrorCode::MISCONFIGURED_ENVIRONMENT,
            "Cannot open a session: environment was not configured");
    }
    if (!environment->data_source || !environment->transaction_factory) {
        throw ExecutorError(ErrorCode::MISCONFIGURED_ENVIRONMENT,
            "Cannot open a session: environment has no data source or transaction factory");
    }
    auto transaction = environment->transaction_factory->new_transaction(environment->data_source, autocommit);
    return open_session(std::move(transaction), autocommit);
}

std::unique_ptr<SqlSession> SqlSessionFactory::open_session(std::unique_ptr<ITransaction> transaction,
                                                            bool autocommit) {
    auto executor = Executor::create(configuration_, std::move(transaction));
    return std::make_unique<SqlSession>(configuration_, std::move(executor), autocommit);
}

} // namespace sqlmemo
