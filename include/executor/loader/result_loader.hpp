#pragma once

#include "cache/cache_key.hpp"
#include "config/configuration.hpp"
#include "core/mapped_object.hpp"
#include "core/types.hpp"
#include "core/value.hpp"
#include "mapping/mapped_statement.hpp"

#include <memory>
#include <thread>

namespace sqlmemo {

class Executor;

/**
 * @brief Runs a nested select for a lazy property
 *
 * Remembers the executor and thread that created it. Loads through that
 * executor when called on the same thread while it is still open.
 * Otherwise (another thread, closed or destroyed executor) a short-lived
 * executor with its own transaction is built from the configured
 * environment, used for the one fetch and closed again.
 */
class ResultLoader : public ILazyLoader {
public:
    ResultLoader(std::shared_ptr<const Configuration> configuration,
                 std::weak_ptr<Executor> executor,
                 std::shared_ptr<const MappedStatement> statement,
                 Value parameter,
                 TargetType target_type,
                 CacheKey key,
                 BoundSql bound_sql);

    [[nodiscard]] Value load() override { return load_result(); }

    /**
     * @brief Fetch and convert to the target type
     * @throws ExecutorError(MISCONFIGURED_ENVIRONMENT) when an isolated
     *         executor is needed but the environment cannot provide one
     */
    Value load_result();

    /// True after load_result() produced null
    [[nodiscard]] bool was_null() const { return was_null_; }

    [[nodiscard]] std::thread::id creator_thread() const { return creator_thread_; }

private:
    ResultListPtr select_list();
    std::shared_ptr<Executor> new_executor() const;

    std::shared_ptr<const Configuration> configuration_;
    std::weak_ptr<Executor> executor_;
    std::shared_ptr<const MappedStatement> statement_;
    Value parameter_;
    TargetType target_type_;
    CacheKey key_;
    BoundSql bound_sql_;
    std::thread::id creator_thread_;
    bool was_null_ = false;
};

} // namespace sqlmemo
