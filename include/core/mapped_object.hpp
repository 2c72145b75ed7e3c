#pragma once

#include "core/value.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace sqlmemo {

/**
 * @brief Deferred producer of one property value
 *
 * Attached to a MappedObject property and invoked on first access.
 */
class ILazyLoader {
public:
    virtual ~ILazyLoader() = default;

    [[nodiscard]] virtual Value load() = 0;
};

/**
 * @brief One node of a mapped object graph
 *
 * A typed property bag built by the row mapper. Properties keep their
 * insertion order. A property may instead carry a lazy loader, which
 * runs the first time the property is read through get_value().
 *
 * Owning edges never form a cycle. A value that already reaches this
 * object (a self reference, or a row whose nested select resolves back
 * to an ancestor) is kept as a back reference: readable through
 * get_value() like any property, but not owned, so it expires with the
 * objects that own it.
 *
 * Not thread-safe: an object is used by one thread at a time.
 */
class MappedObject {
public:
    MappedObject() = default;
    explicit MappedObject(std::string type_name);

    [[nodiscard]] static ObjectPtr create(std::string type_name = {});

    [[nodiscard]] const std::string& type_name() const { return type_name_; }

    /// Raw lookup of an owned property; never triggers a lazy load. nullptr when unset.
    [[nodiscard]] const Value* find(std::string_view name) const;

    /// Raw lookup including back references; never triggers a lazy load
    [[nodiscard]] Value peek(std::string_view name) const;

    [[nodiscard]] bool has(std::string_view name) const;

    /**
     * @brief Read a property, running its lazy loader first if one is attached
     * @return The value, or null when the property is unset
     */
    [[nodiscard]] Value get_value(std::string_view name);

    /**
     * @brief Assign a property. Discards a pending lazy loader for the same name.
     *
     * Stored as a back reference when the value reaches this object.
     */
    void set_value(std::string_view name, Value value);

    bool erase(std::string_view name);

    /// Owned properties only
    [[nodiscard]] const std::vector<std::pair<std::string, Value>>& properties() const {
        return properties_;
    }

    [[nodiscard]] bool is_back_reference(std::string_view name) const;
    [[nodiscard]] size_t back_reference_count() const { return back_references_.size(); }

    // Lazy loading
    void add_lazy_loader(std::string_view name, std::shared_ptr<ILazyLoader> loader);
    [[nodiscard]] bool has_lazy_loader(std::string_view name) const;
    [[nodiscard]] size_t lazy_loader_count() const { return lazy_loaders_.size(); }

    /// Run every pending lazy loader
    void load_all();

private:
    using BackReference = std::variant<std::weak_ptr<MappedObject>, std::weak_ptr<ResultList>>;

    Value* find_mutable(std::string_view name);
    bool erase_property(std::string_view name);
    bool erase_back_reference(std::string_view name);

    std::string type_name_;
    std::vector<std::pair<std::string, Value>> properties_;
    std::vector<std::pair<std::string, BackReference>> back_references_;
    std::unordered_map<std::string, std::shared_ptr<ILazyLoader>> lazy_loaders_;
};

/**
 * @brief True when target is reachable from value over owned edges
 *
 * Follows object properties and list elements; lazy loaders and back
 * references are not followed.
 */
[[nodiscard]] bool value_reaches(const Value& value, const MappedObject* target);

} // namespace sqlmemo
