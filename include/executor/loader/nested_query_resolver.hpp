#pragma once

#include "core/value.hpp"
#include "mapping/mapped_statement.hpp"

namespace sqlmemo {

class Executor;

/**
 * @brief How a nested select property was populated
 */
enum class NestedResolution {
    UNSET,      // Null parameter, property left alone
    DEFERRED,   // Fingerprint already on the memo, assigned via defer_load
    LAZY,       // ResultLoader attached, runs on first access
    LOADED      // Fetched and assigned now
};

/**
 * @brief Populates association properties backed by a nested select
 *
 * Used by row mappers. A fingerprint that is already pending or resolved
 * in the executor's memo is never fetched again: the property is handed
 * to defer_load() instead, which is what breaks self-referencing cycles.
 */
class NestedQueryResolver {
public:
    explicit NestedQueryResolver(Executor& executor) : executor_(executor) {}

    /**
     * @brief Populate target.<nested.property>
     * @param parameter Parameter of the nested statement (usually a column value)
     */
    NestedResolution resolve(const ObjectPtr& target, const NestedSelect& nested, const Value& parameter);

private:
    Executor& executor_;
};

} // namespace sqlmemo
