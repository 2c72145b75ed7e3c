#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace sqlmemo {

class MappedObject;

using ObjectPtr = std::shared_ptr<MappedObject>;
using ResultList = std::vector<ObjectPtr>;
using ResultListPtr = std::shared_ptr<ResultList>;

/**
 * @brief A parameter, column or property value
 *
 * std::monostate is SQL NULL / an unset reference. Objects and lists
 * are shared so that one fetched row can be referenced from several
 * places of the object graph (and from the session memo).
 */
using Value = std::variant<
    std::monostate,
    bool,
    int64_t,
    double,
    std::string,
    ObjectPtr,
    ResultListPtr>;

[[nodiscard]] inline bool is_null(const Value& v) {
    if (std::holds_alternative<std::monostate>(v)) return true;
    if (const auto* obj = std::get_if<ObjectPtr>(&v)) return *obj == nullptr;
    if (const auto* list = std::get_if<ResultListPtr>(&v)) return *list == nullptr;
    return false;
}

// True for everything a column can hold directly (not an object or list)
[[nodiscard]] inline bool is_scalar(const Value& v) {
    return !std::holds_alternative<ObjectPtr>(v) && !std::holds_alternative<ResultListPtr>(v);
}

/**
 * @brief Name of the held alternative ("null", "bool", "int", ...)
 */
[[nodiscard]] const char* value_type_name(const Value& v);

/**
 * @brief Render a value as text
 *
 * Scalars use their SQL text form (booleans as "true"/"false"), null is
 * "null", objects and lists render recursively for diagnostics.
 */
[[nodiscard]] std::string value_to_string(const Value& v);

} // namespace sqlmemo
