#include "executor/executor.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace sqlmemo {

namespace {

// Keeps the nesting depth balanced on every exit path
class DepthGuard {
public:
    explicit DepthGuard(int& depth) : depth_(depth) { ++depth_; }
    ~DepthGuard() { --depth_; }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

private:
    int& depth_;
};

} // anonymous namespace

// ============================================================================
// Construction / destruction
// ============================================================================

Executor::Executor(std::shared_ptr<const Configuration> configuration,
                   std::unique_ptr<ITransaction> transaction)
    : configuration_(std::move(configuration)),
      transaction_(std::move(transaction)),
      local_cache_("LocalCache"),
      output_parameter_cache_("LocalOutputParameterCache") {
    if (!configuration_) {
        throw ExecutorError(ErrorCode::CONFIG_ERROR, "Executor requires a configuration");
    }
    backend_ = configuration_->statement_backend();
    if (!backend_) {
        throw ExecutorError(ErrorCode::CONFIG_ERROR, "Configuration has no statement backend");
    }
    if (!transaction_) {
        throw ExecutorError(ErrorCode::CONFIG_ERROR, "Executor requires a transaction");
    }
}

Executor::~Executor() {
    if (closed_) return;
    try {
        close(false);
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Executor: close during destruction failed: {}", e.what()));
    }
}

std::shared_ptr<Executor> Executor::create(
    std::shared_ptr<const Configuration> configuration,
    std::unique_ptr<ITransaction> transaction) {
    return std::make_shared<Executor>(std::move(configuration), std::move(transaction));
}

void Executor::ensure_open(const char* operation) const {
    if (closed_) {
        throw ExecutorError(ErrorCode::SESSION_CLOSED,
            std::format("Cannot {}: executor was closed", operation));
    }
}

// ============================================================================
// Queries
// ============================================================================

ResultListPtr Executor::query(const MappedStatement& statement, const Value& parameter,
                              const RowBounds& bounds, IResultHandler* handler) {
    ensure_open("query");
    const BoundSql bound_sql = statement.bound_sql(parameter);
    const CacheKey key = create_cache_key(statement, parameter, bounds, bound_sql);
    return query(statement, parameter, bounds, handler, key, bound_sql);
}

ResultListPtr Executor::query(const MappedStatement& statement, const Value& parameter,
                              const RowBounds& bounds, IResultHandler* handler,
                              const CacheKey& key, const BoundSql& bound_sql) {
    ensure_open("query");
    if (query_stack_ == 0 && statement.flush_cache) {
        clear_local_cache();
    }
    ++stats_.queries;

    ResultListPtr list;
    try {
        DepthGuard guard(query_stack_);
        const ResultListPtr* cached = handler ? nullptr : local_cache_.find_resolved(key);
        if (cached) {
            ++stats_.cache_hits;
            list = *cached;
            restore_cached_output_parameters(statement, key, parameter, bound_sql);
        } else if (!handler && local_cache_.is_pending(key)) {
            throw ExecutorError(ErrorCode::RECURSIVE_QUERY,
                std::format("Statement '{}' re-entered while its own fetch is in progress", statement.id));
        } else {
            list = query_from_database(statement, parameter, bounds, handler, key, bound_sql);
        }
    } catch (...) {
        if (query_stack_ == 0) {
            // The outermost call failed: nothing it registered can be applied
            deferred_loads_.clear();
            clear_statement_scope();
        }
        throw;
    }

    if (query_stack_ == 0) {
        try {
            drain_deferred_loads();
        } catch (...) {
            clear_statement_scope();
            throw;
        }
        clear_statement_scope();
    }
    return list;
}

void Executor::clear_statement_scope() {
    if (configuration_->local_cache_scope() == LocalCacheScope::STATEMENT) {
        clear_local_cache();
    }
}

ResultListPtr Executor::query_from_database(const MappedStatement& statement, const Value& parameter,
                                            const RowBounds& bounds, IResultHandler* handler,
                                            const CacheKey& key, const BoundSql& bound_sql) {
    local_cache_.put_pending(key);
    ++stats_.physical_fetches;

    ResultListPtr list;
    try {
        list = backend_->query(*this, statement, parameter, bounds, handler, bound_sql, *transaction_);
    } catch (...) {
        local_cache_.remove(key);
        ++stats_.fetch_failures;
        throw;
    }

    if (!list) {
        list = std::make_shared<ResultList>();
    }
    local_cache_.put(key, list);
    if (statement.is_callable()) {
        output_parameter_cache_.put(key, output_parameters::snapshot(bound_sql, parameter));
    }
    return list;
}

void Executor::restore_cached_output_parameters(const MappedStatement& statement, const CacheKey& key,
                                                const Value& parameter, const BoundSql& bound_sql) {
    if (!statement.is_callable()) return;
    if (const auto* snapshot = output_parameter_cache_.find_resolved(key)) {
        output_parameters::restore(bound_sql, *snapshot, parameter);
    }
}

int64_t Executor::update(const MappedStatement& statement, const Value& parameter) {
    ensure_open("update");
    clear_local_cache();
    ++stats_.updates;
    utils::log::debug(std::format("Executor: {} '{}' cleared the local cache",
                                  command_type_to_string(statement.command_type), statement.id));
    const BoundSql bound_sql = statement.bound_sql(parameter);
    return backend_->update(*this, statement, parameter, bound_sql, *transaction_);
}

std::vector<BatchResult> Executor::flush_statements(bool is_rollback) {
    ensure_open("flush statements");
    return backend_->flush_statements(is_rollback, *transaction_);
}

// ============================================================================
// Fingerprints and deferred loads
// ============================================================================

CacheKey Executor::create_cache_key(const MappedStatement& statement, const Value& /*parameter*/,
                                    const RowBounds& bounds, const BoundSql& bound_sql) const {
    ensure_open("create cache key");

    CacheKey key;
    key.update(statement.id);
    key.update(bounds.offset);
    key.update(bounds.limit);
    key.update(bound_sql.sql());
    for (const auto& mapping : bound_sql.parameter_mappings()) {
        if (mapping.mode != ParameterMode::OUT) {
            key.update(bound_sql.parameter_value(mapping));
        }
    }
    if (const auto* environment = configuration_->environment()) {
        key.update(environment->id);
    }
    return key;
}

bool Executor::is_cached(const MappedStatement& /*statement*/, const CacheKey& key) const {
    return local_cache_.contains(key);
}

void Executor::defer_load(const MappedStatement& statement, ObjectPtr target, std::string property,
                          const CacheKey& key, TargetType target_type) {
    ensure_open("defer load");
    ++stats_.deferred_loads_registered;
    DeferredLoad load(std::move(target), std::move(property), key, target_type);
    if (deferred_loads_.register_load(std::move(load), local_cache_)) {
        ++stats_.deferred_loads_immediate;
    } else {
        utils::log::debug(std::format("Executor: deferred load queued for '{}' ({} pending)",
                                      statement.id, deferred_loads_.size()));
    }
}

void Executor::drain_deferred_loads() {
    if (deferred_loads_.empty()) return;
    const auto result = deferred_loads_.drain_all(local_cache_);
    stats_.deferred_loads_applied += result.applied;
    stats_.deferred_loads_unresolved += result.unresolved;
}

// ============================================================================
// Lifecycle
// ============================================================================

void Executor::commit(bool required) {
    ensure_open("commit");
    clear_local_cache();
    flush_statements();
    if (required) {
        transaction_->commit();
    }
}

void Executor::rollback(bool required) {
    if (closed_) return;
    try {
        clear_local_cache();
        flush_statements(true);
    } catch (...) {
        if (required) {
            transaction_->rollback();
        }
        throw;
    }
    if (required) {
        transaction_->rollback();
    }
}

void Executor::clear_local_cache() {
    if (closed_) return;
    local_cache_.clear();
    output_parameter_cache_.clear();
    ++stats_.cache_clears;
}

void Executor::close(bool force_rollback) {
    if (closed_) return;

    try {
        rollback(force_rollback);
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Executor: rollback on close failed: {}", e.what()));
    }
    try {
        transaction_->close();
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Executor: transaction close failed: {}", e.what()));
    }

    deferred_loads_.clear();
    local_cache_.clear();
    output_parameter_cache_.clear();
    transaction_.reset();
    closed_ = true;
}

ITransaction& Executor::transaction() {
    ensure_open("get transaction");
    return *transaction_;
}

} // namespace sqlmemo
