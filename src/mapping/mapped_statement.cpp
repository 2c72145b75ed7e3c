#include "mapping/mapped_statement.hpp"
#include "core/error.hpp"
#include "core/mapped_object.hpp"
#include "reflection/meta_object.hpp"

#include <format>

namespace sqlmemo {

// ============================================================================
// BoundSql
// ============================================================================

BoundSql::BoundSql(std::string sql, std::vector<ParameterMapping> mappings, Value parameter_object)
    : sql_(std::move(sql)),
      mappings_(std::move(mappings)),
      parameter_object_(std::move(parameter_object)) {}

void BoundSql::set_additional_parameter(const std::string& name, Value value) {
    additional_[name] = std::move(value);
}

bool BoundSql::has_additional_parameter(std::string_view path) const {
    const PropertyTokenizer prop(path);
    return additional_.contains(prop.name());
}

Value BoundSql::additional_parameter(std::string_view path) const {
    const PropertyTokenizer prop(path);
    const auto it = additional_.find(prop.name());
    if (it == additional_.end()) return {};
    if (!prop.has_next() && !prop.index()) return it->second;
    // Resolve the indexed / nested remainder through a one-property holder
    auto holder = MappedObject::create();
    holder->set_value(prop.name(), it->second);
    return MetaObject(holder).get_value(path);
}

Value BoundSql::parameter_value(const ParameterMapping& mapping) const {
    if (has_additional_parameter(mapping.property)) {
        return additional_parameter(mapping.property);
    }
    if (is_null(parameter_object_)) {
        return {};
    }
    if (is_scalar(parameter_object_)) {
        return parameter_object_;
    }
    return MetaObject::get_value(parameter_object_, mapping.property);
}

std::vector<Value> BoundSql::input_values() const {
    std::vector<Value> values;
    values.reserve(mappings_.size());
    for (const auto& mapping : mappings_) {
        if (mapping.mode != ParameterMode::OUT) {
            values.push_back(parameter_value(mapping));
        }
    }
    return values;
}

// ============================================================================
// MappedStatement
// ============================================================================

BoundSql MappedStatement::bound_sql(const Value& parameter) const {
    if (!sql_source) {
        throw ExecutorError(ErrorCode::STATEMENT_NOT_FOUND,
            std::format("Mapped statement '{}' has no SQL source", id));
    }
    return sql_source->bound_sql(parameter);
}

// ============================================================================
// Output parameters
// ============================================================================

namespace output_parameters {

ObjectPtr snapshot(const BoundSql& bound_sql, const Value& parameter) {
    const auto* live = std::get_if<ObjectPtr>(&parameter);
    if (!live || !*live) return nullptr;

    auto copy = MappedObject::create((*live)->type_name());
    MetaObject meta(copy);
    for (const auto& mapping : bound_sql.parameter_mappings()) {
        if (mapping.mode != ParameterMode::IN) {
            meta.set_value(mapping.property, MetaObject::get_value(parameter, mapping.property));
        }
    }
    return copy;
}

void restore(const BoundSql& bound_sql, const ObjectPtr& snapshot, const Value& parameter) {
    const auto* live = std::get_if<ObjectPtr>(&parameter);
    if (!snapshot || !live || !*live) return;

    MetaObject target(*live);
    for (const auto& mapping : bound_sql.parameter_mappings()) {
        if (mapping.mode != ParameterMode::IN) {
            target.set_value(mapping.property, MetaObject(snapshot).get_value(mapping.property));
        }
    }
}

} // namespace output_parameters

} // namespace sqlmemo
