#pragma once

#include "cache/cache_key.hpp"
#include "cache/local_cache.hpp"
#include "config/configuration.hpp"
#include "core/types.hpp"
#include "core/value.hpp"
#include "executor/deferred_load.hpp"
#include "executor/istatement_backend.hpp"
#include "mapping/mapped_statement.hpp"
#include "transaction/itransaction.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sqlmemo {

/**
 * @brief Execution coordinator of one session
 *
 * Owns the session memo (query fingerprint → result list), the output
 * parameter memo of stored procedures, the deferred load queue and the
 * nesting depth counter. Every query of the session goes through it:
 * - Resolved fingerprint: the memoized list is returned as is
 * - Absent fingerprint: a Pending marker is installed, the backend runs
 *   the statement, the marker is replaced by the result (or removed if
 *   the backend throws)
 * - Pending fingerprint: direct re-entry is rejected; nested selects go
 *   through is_cached() + defer_load() instead
 *
 * When the outermost query returns, deferred loads are applied and, for
 * STATEMENT scope, the memo is dropped. Any write clears the memo.
 *
 * Open → Closed (terminal). Not thread-safe: an executor belongs to the
 * thread that opened its session.
 */
class Executor : public std::enable_shared_from_this<Executor> {
public:
    struct Stats {
        size_t queries = 0;
        size_t cache_hits = 0;
        size_t physical_fetches = 0;
        size_t fetch_failures = 0;
        size_t updates = 0;
        size_t cache_clears = 0;
        size_t deferred_loads_registered = 0;
        size_t deferred_loads_immediate = 0;    // Applied on registration (fast path)
        size_t deferred_loads_applied = 0;      // Applied by a drain
        size_t deferred_loads_unresolved = 0;   // Dropped by a drain, property left unset
    };

    /**
     * @throws ExecutorError(CONFIG_ERROR) when configuration, statement
     *         backend or transaction is missing
     */
    Executor(std::shared_ptr<const Configuration> configuration,
             std::unique_ptr<ITransaction> transaction);

    /// Destroying an open executor closes it without forcing a rollback
    ~Executor();

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    [[nodiscard]] static std::shared_ptr<Executor> create(
        std::shared_ptr<const Configuration> configuration,
        std::unique_ptr<ITransaction> transaction);

    // ---- Queries -----------------------------------------------------------

    /**
     * @brief Run a select through the session memo
     * @param handler When set, the memo is not consulted and rows are
     *        streamed to the handler
     * @throws ExecutorError(SESSION_CLOSED), ExecutorError(RECURSIVE_QUERY),
     *         DataAccessError from the backend
     */
    ResultListPtr query(const MappedStatement& statement, const Value& parameter,
                        const RowBounds& bounds = {}, IResultHandler* handler = nullptr);

    /// Same, with a precomputed fingerprint and bound SQL
    ResultListPtr query(const MappedStatement& statement, const Value& parameter,
                        const RowBounds& bounds, IResultHandler* handler,
                        const CacheKey& key, const BoundSql& bound_sql);

    /**
     * @brief Run an INSERT / UPDATE / DELETE
     *
     * Clears both memos before delegating.
     */
    int64_t update(const MappedStatement& statement, const Value& parameter);

    std::vector<BatchResult> flush_statements(bool is_rollback = false);

    // ---- Fingerprints and deferred loads -----------------------------------

    /**
     * @brief Fingerprint of one invocation
     *
     * Folds statement id, offset, limit, SQL text, every non-OUT parameter
     * value in placeholder order and the environment id.
     */
    [[nodiscard]] CacheKey create_cache_key(const MappedStatement& statement, const Value& parameter,
                                            const RowBounds& bounds, const BoundSql& bound_sql) const;

    /// True when the fingerprint is pending or resolved
    [[nodiscard]] bool is_cached(const MappedStatement& statement, const CacheKey& key) const;

    /**
     * @brief Assign target.property from the memo entry of key
     *
     * Applied at once when the entry is resolved, otherwise queued until
     * the outermost query completes.
     */
    void defer_load(const MappedStatement& statement, ObjectPtr target, std::string property,
                    const CacheKey& key, TargetType target_type);

    // ---- Lifecycle ---------------------------------------------------------

    void commit(bool required);
    void rollback(bool required);   // No-op once closed
    void clear_local_cache();

    /**
     * @brief Roll back (when forced), close the transaction, drop all state
     *
     * Failures of the rollback or the transaction close are logged and
     * swallowed. Idempotent.
     */
    void close(bool force_rollback);

    [[nodiscard]] bool is_closed() const { return closed_; }

    /// @throws ExecutorError(SESSION_CLOSED)
    [[nodiscard]] ITransaction& transaction();

    // ---- Introspection -----------------------------------------------------

    [[nodiscard]] const Configuration& configuration() const { return *configuration_; }
    [[nodiscard]] const std::shared_ptr<const Configuration>& configuration_ptr() const { return configuration_; }
    [[nodiscard]] int nesting_depth() const { return query_stack_; }
    [[nodiscard]] const ResultMemo& local_cache() const { return local_cache_; }
    [[nodiscard]] size_t pending_deferred_loads() const { return deferred_loads_.size(); }
    [[nodiscard]] const Stats& stats() const { return stats_; }

private:
    void ensure_open(const char* operation) const;

    ResultListPtr query_from_database(const MappedStatement& statement, const Value& parameter,
                                      const RowBounds& bounds, IResultHandler* handler,
                                      const CacheKey& key, const BoundSql& bound_sql);

    void restore_cached_output_parameters(const MappedStatement& statement, const CacheKey& key,
                                          const Value& parameter, const BoundSql& bound_sql);

    void drain_deferred_loads();

    // Ends the outermost query under LocalCacheScope::STATEMENT
    void clear_statement_scope();

    std::shared_ptr<const Configuration> configuration_;
    std::shared_ptr<IStatementBackend> backend_;
    std::unique_ptr<ITransaction> transaction_;

    ResultMemo local_cache_;
    LocalCache<ObjectPtr> output_parameter_cache_;
    DeferredLoadQueue deferred_loads_;

    int query_stack_ = 0;
    bool closed_ = false;
    Stats stats_;
};

} // namespace sqlmemo
