#pragma once

#include "cache/cache_key.hpp"

#include <iterator>
#include <list>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace sqlmemo {

/**
 * @brief Marker for a fetch in progress on the current call stack
 *
 * Lets a nested lookup see that its fingerprint is already being
 * fetched without mistaking the marker for a result.
 */
struct ExecutionPlaceholder {
    bool operator==(const ExecutionPlaceholder&) const = default;
};

/// Pending (placeholder) or Resolved(T). Absent is "no entry".
template<typename T>
using MemoEntry = std::variant<ExecutionPlaceholder, T>;

/**
 * @brief Session-scoped memo keyed by query fingerprint
 *
 * Insertion-ordered (list + hash index, same layout as an LRU shard but
 * without eviction): keys() walks entries in the order they were first
 * inserted. Resolving a pending entry keeps its position.
 *
 * Owned by exactly one executor; no internal locking.
 */
template<typename T>
class LocalCache {
public:
    using Entry = MemoEntry<T>;

    explicit LocalCache(std::string id) : id_(std::move(id)) {}

    LocalCache(const LocalCache&) = delete;
    LocalCache& operator=(const LocalCache&) = delete;

    [[nodiscard]] const std::string& id() const { return id_; }

    /// Entry for key, or nullopt when absent
    [[nodiscard]] std::optional<Entry> get(const CacheKey& key) const {
        const auto it = index_.find(key);
        if (it == index_.end()) return std::nullopt;
        return it->second->second;
    }

    /// Resolved value for key, nullptr when absent or pending
    [[nodiscard]] const T* find_resolved(const CacheKey& key) const {
        const auto it = index_.find(key);
        if (it == index_.end()) return nullptr;
        return std::get_if<T>(&it->second->second);
    }

    [[nodiscard]] bool contains(const CacheKey& key) const {
        return index_.contains(key);
    }

    [[nodiscard]] bool is_pending(const CacheKey& key) const {
        const auto it = index_.find(key);
        return it != index_.end() &&
               std::holds_alternative<ExecutionPlaceholder>(it->second->second);
    }

    [[nodiscard]] bool is_resolved(const CacheKey& key) const {
        return find_resolved(key) != nullptr;
    }

    void put(const CacheKey& key, T value) {
        assign(key, Entry{std::in_place_index<1>, std::move(value)});
    }

    void put_pending(const CacheKey& key) {
        assign(key, Entry{std::in_place_index<0>});
    }

    bool remove(const CacheKey& key) {
        const auto it = index_.find(key);
        if (it == index_.end()) return false;
        order_.erase(it->second);
        index_.erase(it);
        return true;
    }

    void clear() {
        index_.clear();
        order_.clear();
    }

    [[nodiscard]] size_t size() const { return index_.size(); }
    [[nodiscard]] bool empty() const { return index_.empty(); }

    /// Keys in insertion order
    [[nodiscard]] std::vector<CacheKey> keys() const {
        std::vector<CacheKey> result;
        result.reserve(order_.size());
        for (const auto& [key, _] : order_) {
            result.push_back(key);
        }
        return result;
    }

private:
    using Slot = std::pair<CacheKey, Entry>;

    void assign(const CacheKey& key, Entry entry) {
        const auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = std::move(entry);
            return;
        }
        order_.emplace_back(key, std::move(entry));
        index_.emplace(key, std::prev(order_.end()));
    }

    std::string id_;
    std::list<Slot> order_;
    std::unordered_map<CacheKey, typename std::list<Slot>::iterator> index_;
};

} // namespace sqlmemo
