#include "executor/loader/nested_query_resolver.hpp"
#include "executor/executor.hpp"
#include "executor/loader/result_loader.hpp"
#include "executor/result_extractor.hpp"
#include "reflection/meta_object.hpp"

namespace sqlmemo {

NestedResolution NestedQueryResolver::resolve(const ObjectPtr& target, const NestedSelect& nested,
                                              const Value& parameter) {
    if (!target || is_null(parameter)) {
        return NestedResolution::UNSET;
    }

    const auto& configuration = executor_.configuration();
    const auto statement = configuration.statement(nested.statement_id);
    const RowBounds bounds;
    const BoundSql bound_sql = statement->bound_sql(parameter);
    const CacheKey key = executor_.create_cache_key(*statement, parameter, bounds, bound_sql);

    if (executor_.is_cached(*statement, key)) {
        executor_.defer_load(*statement, target, nested.property, key, nested.target_type);
        return NestedResolution::DEFERRED;
    }

    if (nested.lazy && configuration.lazy_loading_enabled()) {
        auto loader = std::make_shared<ResultLoader>(
            executor_.configuration_ptr(), executor_.weak_from_this(), statement,
            parameter, nested.target_type, key, bound_sql);
        target->add_lazy_loader(nested.property, std::move(loader));
        return NestedResolution::LAZY;
    }

    const auto list = executor_.query(*statement, parameter, bounds, nullptr, key, bound_sql);
    MetaObject(target).set_value(nested.property, extract_object_from_list(list, nested.target_type));
    return NestedResolution::LOADED;
}

} // namespace sqlmemo
