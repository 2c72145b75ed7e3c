#pragma once

#include "core/types.hpp"
#include "core/value.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sqlmemo {

// ============================================================================
// Parameters
// ============================================================================

struct ParameterMapping {
    std::string property;                       // Path into the parameter object
    ParameterMode mode = ParameterMode::IN;
};

/**
 * @brief SQL text plus everything needed to bind its placeholders
 *
 * Produced by an ISqlSource for one parameter object. Additional
 * parameters are values generated while building the SQL (loop
 * variables and the like); they shadow properties of the parameter
 * object with the same name.
 */
class BoundSql {
public:
    BoundSql() = default;
    BoundSql(std::string sql, std::vector<ParameterMapping> mappings, Value parameter_object);

    [[nodiscard]] const std::string& sql() const { return sql_; }
    [[nodiscard]] const std::vector<ParameterMapping>& parameter_mappings() const { return mappings_; }
    [[nodiscard]] const Value& parameter_object() const { return parameter_object_; }

    void set_additional_parameter(const std::string& name, Value value);
    [[nodiscard]] bool has_additional_parameter(std::string_view path) const;
    [[nodiscard]] Value additional_parameter(std::string_view path) const;

    /**
     * @brief Value bound to one placeholder
     *
     * Lookup order: additional parameter, null parameter object (→ null),
     * scalar parameter object (→ the scalar), property path on the
     * parameter object.
     */
    [[nodiscard]] Value parameter_value(const ParameterMapping& mapping) const;

    /// Values of every non-OUT mapping, in placeholder order
    [[nodiscard]] std::vector<Value> input_values() const;

private:
    std::string sql_;
    std::vector<ParameterMapping> mappings_;
    Value parameter_object_;
    std::unordered_map<std::string, Value> additional_;
};

/**
 * @brief Produces BoundSql for a parameter object
 *
 * SQL generation itself (dynamic SQL, dialects) lives behind this seam.
 */
class ISqlSource {
public:
    virtual ~ISqlSource() = default;

    [[nodiscard]] virtual BoundSql bound_sql(const Value& parameter) const = 0;
};

/**
 * @brief SQL source with fixed text and fixed parameter mappings
 */
class StaticSqlSource : public ISqlSource {
public:
    StaticSqlSource(std::string sql, std::vector<ParameterMapping> mappings = {})
        : sql_(std::move(sql)), mappings_(std::move(mappings)) {}

    [[nodiscard]] BoundSql bound_sql(const Value& parameter) const override {
        return BoundSql(sql_, mappings_, parameter);
    }

private:
    std::string sql_;
    std::vector<ParameterMapping> mappings_;
};

// ============================================================================
// Mapped Statement
// ============================================================================

/**
 * @brief Association populated by running another statement per row
 *
 * The value of `column` in the current row is the nested statement's
 * parameter. A null column leaves the property unset.
 */
struct NestedSelect {
    std::string property;
    std::string statement_id;
    std::string column;
    TargetType target_type = TargetType::OBJECT;
    bool lazy = false;
};

struct MappedStatement {
    std::string id;
    std::string resource;                           // Where the statement was declared
    CommandType command_type = CommandType::SELECT;
    StatementType statement_type = StatementType::PREPARED;
    bool flush_cache = false;                       // Clear the memo before the outermost run
    std::string result_type;                        // Type name given to mapped rows
    std::shared_ptr<const ISqlSource> sql_source;
    std::vector<NestedSelect> nested_selects;

    [[nodiscard]] BoundSql bound_sql(const Value& parameter) const;
    [[nodiscard]] bool is_callable() const { return statement_type == StatementType::CALLABLE; }
};

/**
 * @brief Copies OUT / INOUT values between a live parameter object and
 *        a cached snapshot
 */
namespace output_parameters {

/// New object holding only the OUT / INOUT properties of parameter
[[nodiscard]] ObjectPtr snapshot(const BoundSql& bound_sql, const Value& parameter);

/// Write the snapshot's OUT / INOUT properties into parameter
void restore(const BoundSql& bound_sql, const ObjectPtr& snapshot, const Value& parameter);

} // namespace output_parameters

} // namespace sqlmemo
