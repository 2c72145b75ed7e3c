#include "core/value.hpp"
#include "core/mapped_object.hpp"

#include <format>
#include <type_traits>

namespace sqlmemo {

const char* value_type_name(const Value& v) {
    switch (v.index()) {
        case 0: return "null";
        case 1: return "bool";
        case 2: return "int";
        case 3: return "double";
        case 4: return "string";
        case 5: return "object";
        case 6: return "list";
        default: return "unknown";
    }
}

std::string value_to_string(const Value& v) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return x ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(x);
        } else if constexpr (std::is_same_v<T, double>) {
            return std::format("{}", x);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return x;
        } else if constexpr (std::is_same_v<T, ObjectPtr>) {
            if (!x) return "null";
            std::string out = x->type_name() + "{";
            bool first = true;
            for (const auto& [name, value] : x->properties()) {
                if (!first) out += ", ";
                first = false;
                out += name;
                out += '=';
                // Objects may reference themselves; print nested objects shallowly
                out += std::holds_alternative<ObjectPtr>(value) && !is_null(value)
                    ? std::get<ObjectPtr>(value)->type_name() + "{...}"
                    : value_to_string(value);
            }
            return out + "}";
        } else {
            if (!x) return "null";
            return std::format("[{} rows]", x->size());
        }
    }, v);
}

} // namespace sqlmemo
