#pragma once

#include "core/value.hpp"

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace sqlmemo {

/**
 * @brief Order-sensitive composite fingerprint of a query invocation
 *
 * Components are folded one at a time with update(). Each component is
 * serialized (type tag + payload) and chained into an xxHash64 seeded
 * with the previous hash, so the same components in a different order
 * give a different hash. The full component list is kept for equality;
 * two keys are equal iff every component matches in the same order.
 *
 * Null folds as its own marker. Objects and lists fold recursively
 * (type name, property names and values) behind structural markers that
 * can never compare equal to a plain string component.
 *
 * Example:
 *   CacheKey key;
 *   key.update(std::string("UserMapper.find"));
 *   key.update(int64_t{0});
 *   key.update(Value{});     // null parameter
 */
class CacheKey {
public:
    // Opening marker of a folded object or list
    struct CompositeMarker {
        char kind = 'o';        // 'o' object, 'l' list
        std::string label;      // Object type name
        size_t size = 0;        // Property or element count

        bool operator==(const CompositeMarker&) const = default;
    };

    using Component = std::variant<
        std::monostate,
        bool,
        int64_t,
        double,
        std::string,
        CompositeMarker>;

    CacheKey() = default;

    void update(const Value& value);

    template<typename It>
    void update_all(It first, It last) {
        for (; first != last; ++first) {
            update(*first);
        }
    }

    [[nodiscard]] uint64_t hash() const { return hash_; }
    [[nodiscard]] size_t update_count() const { return components_.size(); }
    [[nodiscard]] const std::vector<Component>& components() const { return components_; }

    /// "hash:checksum:comp1:comp2:..." for logs
    [[nodiscard]] std::string to_string() const;

    bool operator==(const CacheKey& other) const;

private:
    static constexpr uint64_t kInitialSeed = 17;

    void fold(Component component);

    uint64_t hash_ = kInitialSeed;
    uint64_t checksum_ = 0;     // Order-independent sum, cheap early reject
    std::vector<Component> components_;
};

} // namespace sqlmemo

template<>
struct std::hash<sqlmemo::CacheKey> {
    size_t operator()(const sqlmemo::CacheKey& key) const noexcept {
        return static_cast<size_t>(key.hash());
    }
};
