#include "config/configuration.hpp"
#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "transaction/connection_transaction.hpp"

#include <format>

namespace sqlmemo {

std::shared_ptr<Configuration> Configuration::from_config(
    const SqlMemoConfig& config, std::shared_ptr<IStatementBackend> backend) {

    auto configuration = std::make_shared<Configuration>(config.session);
    configuration->set_statement_backend(std::move(backend));

    if (const auto level = ConfigLoader::parse_log_level(config.logging.level)) {
        utils::log::set_level(*level);
    }

    if (config.environment) {
        Environment environment;
        environment.id = config.environment->id;
        if (!config.environment->connection_string.empty()) {
            environment.data_source = std::make_shared<PgDataSource>(config.environment->connection_string);
            environment.transaction_factory = std::make_shared<ConnectionTransactionFactory>();
        }
        configuration->set_environment(std::move(environment));
    }

    utils::log::info(std::format("Configuration: local_cache_scope={}, lazy_loading={}, environment={}",
        local_cache_scope_to_string(configuration->local_cache_scope()),
        configuration->lazy_loading_enabled(),
        configuration->environment() ? configuration->environment()->id : std::string("none")));

    return configuration;
}

void Configuration::set_environment(Environment environment) {
    environment_ = std::move(environment);
}

void Configuration::add_statement(MappedStatement statement) {
    if (!statement.sql_source) {
        throw ExecutorError(ErrorCode::CONFIG_ERROR,
            std::format("Statement '{}' has no SQL source", statement.id));
    }
    auto id = statement.id;
    statements_[std::move(id)] = std::make_shared<const MappedStatement>(std::move(statement));
}

bool Configuration::has_statement(std::string_view id) const {
    return statements_.contains(std::string(id));
}

std::shared_ptr<const MappedStatement> Configuration::statement(std::string_view id) const {
    const auto it = statements_.find(std::string(id));
    if (it == statements_.end()) {
        throw ExecutorError(ErrorCode::STATEMENT_NOT_FOUND,
            std::format("Mapped statement '{}' is not registered", id));
    }
    return it->second;
}

} // namespace sqlmemo
