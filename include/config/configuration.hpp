#pragma once

#include "config/config_types.hpp"
#include "db/idata_source.hpp"
#include "mapping/mapped_statement.hpp"
#include "transaction/itransaction.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sqlmemo {

class IStatementBackend;

/**
 * @brief Where isolated executors get their transactions from
 */
struct Environment {
    std::string id;                                         // Folded into every fingerprint
    std::shared_ptr<IDataSource> data_source;
    std::shared_ptr<ITransactionFactory> transaction_factory;
};

/**
 * @brief Runtime configuration shared by sessions and executors
 *
 * Holds settings, the optional environment, the statement registry and
 * the statement backend. Populated at startup, read-only afterwards.
 */
class Configuration {
public:
    Configuration() = default;
    explicit Configuration(SessionSettings settings) : settings_(settings) {}

    /**
     * @brief Build from a loaded config file
     *
     * A non-empty environment connection string wires a PostgreSQL data
     * source and a BEGIN/COMMIT transaction factory. Also applies the
     * configured log level.
     */
    [[nodiscard]] static std::shared_ptr<Configuration> from_config(
        const SqlMemoConfig& config, std::shared_ptr<IStatementBackend> backend);

    // Settings
    [[nodiscard]] const SessionSettings& settings() const { return settings_; }
    [[nodiscard]] LocalCacheScope local_cache_scope() const { return settings_.local_cache_scope; }
    [[nodiscard]] bool lazy_loading_enabled() const { return settings_.lazy_loading_enabled; }
    void set_local_cache_scope(LocalCacheScope scope) { settings_.local_cache_scope = scope; }
    void set_lazy_loading_enabled(bool enabled) { settings_.lazy_loading_enabled = enabled; }

    // Environment
    void set_environment(Environment environment);
    [[nodiscard]] const Environment* environment() const {
        return environment_ ? &*environment_ : nullptr;
    }

    // Backend
    void set_statement_backend(std::shared_ptr<IStatementBackend> backend) { backend_ = std::move(backend); }
    [[nodiscard]] const std::shared_ptr<IStatementBackend>& statement_backend() const { return backend_; }

    // Statements
    void add_statement(MappedStatement statement);
    [[nodiscard]] bool has_statement(std::string_view id) const;

    /// @throws ExecutorError(STATEMENT_NOT_FOUND)
    [[nodiscard]] std::shared_ptr<const MappedStatement> statement(std::string_view id) const;

    [[nodiscard]] size_t statement_count() const { return statements_.size(); }

private:
    SessionSettings settings_;
    std::optional<Environment> environment_;
    std::shared_ptr<IStatementBackend> backend_;
    std::unordered_map<std::string, std::shared_ptr<const MappedStatement>> statements_;
};

} // namespace sqlmemo
