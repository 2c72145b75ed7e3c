#pragma once

#include "core/value.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace sqlmemo {

/**
 * @brief Splits a property path into its first segment and the remainder
 *
 * "orders[1].customer.name" → name "orders", index 1,
 * children "customer.name".
 */
class PropertyTokenizer {
public:
    explicit PropertyTokenizer(std::string_view full_name);

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::optional<size_t>& index() const { return index_; }
    [[nodiscard]] const std::string& children() const { return children_; }
    [[nodiscard]] bool has_next() const { return !children_.empty(); }

private:
    std::string name_;
    std::optional<size_t> index_;
    std::string children_;
};

/**
 * @brief Path-based reads and writes over mapped object graphs
 *
 * This is the property writer used by deferred loads and output
 * parameter restore, and the property reader used when binding
 * parameters.
 */
class MetaObject {
public:
    explicit MetaObject(ObjectPtr root) : root_(std::move(root)) {}

    /**
     * @brief Read a (dotted, optionally indexed) property path
     * @return null when any segment is missing; lazy properties are loaded
     */
    [[nodiscard]] Value get_value(std::string_view path) const;

    /**
     * @brief Write a property path, creating missing intermediate objects
     * @throws ExecutorError(REFLECTION_ERROR) on an out-of-range index or
     *         when an intermediate segment holds a scalar
     */
    void set_value(std::string_view path, Value value);

    [[nodiscard]] bool has_property(std::string_view path) const;

    [[nodiscard]] const ObjectPtr& object() const { return root_; }

    /// Read a path from any value (scalars have no properties)
    [[nodiscard]] static Value get_value(const Value& root, std::string_view path);

private:
    ObjectPtr root_;
};

} // namespace sqlmemo
