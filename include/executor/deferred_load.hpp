#pragma once

#include "cache/cache_key.hpp"
#include "cache/local_cache.hpp"
#include "core/types.hpp"
#include "core/value.hpp"

#include <cstddef>
#include <deque>
#include <string>

namespace sqlmemo {

using ResultMemo = LocalCache<ResultListPtr>;

/**
 * @brief "Property P of object O gets whatever the memo holds under F"
 *
 * Created when a nested select's fingerprint is already on the memo
 * (pending or resolved). Applied once the fingerprint is resolved.
 */
class DeferredLoad {
public:
    DeferredLoad(ObjectPtr target, std::string property, CacheKey key, TargetType target_type);

    /// True when the memo holds a resolved result for the key
    [[nodiscard]] bool can_load(const ResultMemo& memo) const;

    /**
     * @brief Write the resolved result into the target property
     * @pre can_load(memo)
     */
    void load(const ResultMemo& memo) const;

    [[nodiscard]] const ObjectPtr& target() const { return target_; }
    [[nodiscard]] const std::string& property() const { return property_; }
    [[nodiscard]] const CacheKey& key() const { return key_; }
    [[nodiscard]] TargetType target_type() const { return target_type_; }

private:
    ObjectPtr target_;
    std::string property_;
    CacheKey key_;
    TargetType target_type_;
};

/**
 * @brief Deferred loads registered while a query is nested in another
 *
 * Drained only when the outermost query of the executor completes.
 */
class DeferredLoadQueue {
public:
    struct DrainResult {
        size_t applied = 0;
        size_t unresolved = 0;
    };

    /**
     * @brief Apply immediately when the key is resolved, else enqueue
     * @return true when the load was applied immediately
     */
    bool register_load(DeferredLoad load, const ResultMemo& memo);

    /**
     * @brief Apply every queued load in registration order
     *
     * One-shot: the queue is empty afterwards, including loads whose key
     * never resolved (left unset and counted as unresolved) and including
     * the case where applying a load throws.
     */
    DrainResult drain_all(const ResultMemo& memo);

    void clear() { loads_.clear(); }
    [[nodiscard]] size_t size() const { return loads_.size(); }
    [[nodiscard]] bool empty() const { return loads_.empty(); }

private:
    std::deque<DeferredLoad> loads_;
};

} // namespace sqlmemo
