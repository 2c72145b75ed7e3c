#include "reflection/meta_object.hpp"
#include "core/error.hpp"
#include "core/mapped_object.hpp"

#include <charconv>
#include <format>

namespace sqlmemo {

// ============================================================================
// PropertyTokenizer
// ============================================================================

PropertyTokenizer::PropertyTokenizer(std::string_view full_name) {
    const auto delim = full_name.find('.');
    std::string_view head = full_name;
    if (delim != std::string_view::npos) {
        head = full_name.substr(0, delim);
        children_ = std::string(full_name.substr(delim + 1));
    }

    const auto open = head.find('[');
    if (open != std::string_view::npos && head.back() == ']') {
        const auto digits = head.substr(open + 1, head.size() - open - 2);
        size_t idx = 0;
        const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), idx);
        if (ec == std::errc{} && ptr == digits.data() + digits.size()) {
            index_ = idx;
        }
        head = head.substr(0, open);
    }
    name_ = std::string(head);
}

// ============================================================================
// Helpers
// ============================================================================

namespace {

// Resolve one segment (name plus optional index) against an object
Value read_segment(const ObjectPtr& obj, const PropertyTokenizer& prop) {
    if (!obj) return {};
    Value v = obj->get_value(prop.name());
    if (!prop.index()) return v;

    const auto* list = std::get_if<ResultListPtr>(&v);
    if (!list || !*list || *prop.index() >= (*list)->size()) return {};
    return (**list)[*prop.index()];
}

} // anonymous namespace

// ============================================================================
// MetaObject
// ============================================================================

Value MetaObject::get_value(const Value& root, std::string_view path) {
    if (path.empty()) return root;
    const auto* obj = std::get_if<ObjectPtr>(&root);
    if (!obj || !*obj) return {};
    return MetaObject(*obj).get_value(path);
}

Value MetaObject::get_value(std::string_view path) const {
    PropertyTokenizer prop(path);
    Value v = read_segment(root_, prop);
    if (!prop.has_next()) return v;
    return get_value(v, prop.children());
}

bool MetaObject::has_property(std::string_view path) const {
    if (!root_) return false;
    PropertyTokenizer prop(path);
    if (!prop.has_next()) {
        return root_->has(prop.name()) || root_->has_lazy_loader(prop.name());
    }
    const Value child = root_->peek(prop.name());
    const auto* obj = std::get_if<ObjectPtr>(&child);
    return obj && *obj && MetaObject(*obj).has_property(prop.children());
}

void MetaObject::set_value(std::string_view path, Value value) {
    if (!root_) {
        throw ExecutorError(ErrorCode::REFLECTION_ERROR,
            std::format("Cannot set property '{}' on a null object", path));
    }

    PropertyTokenizer prop(path);

    if (prop.index()) {
        Value current = root_->get_value(prop.name());
        auto* list = std::get_if<ResultListPtr>(&current);
        if (!list || !*list || *prop.index() >= (*list)->size()) {
            throw ExecutorError(ErrorCode::REFLECTION_ERROR,
                std::format("Index {} out of range for property '{}' of '{}'",
                            *prop.index(), prop.name(), root_->type_name()));
        }
        auto& element = (**list)[*prop.index()];
        if (!prop.has_next()) {
            auto* obj = std::get_if<ObjectPtr>(&value);
            if (!obj && !is_null(value)) {
                throw ExecutorError(ErrorCode::REFLECTION_ERROR,
                    std::format("List element '{}' can only hold an object", path));
            }
            element = obj ? *obj : nullptr;
            return;
        }
        if (!element) element = MappedObject::create();
        MetaObject(element).set_value(prop.children(), std::move(value));
        return;
    }

    if (!prop.has_next()) {
        root_->set_value(prop.name(), std::move(value));
        return;
    }

    Value child = root_->get_value(prop.name());
    if (is_null(child)) {
        // Instantiate the missing intermediate object
        auto created = MappedObject::create();
        root_->set_value(prop.name(), created);
        MetaObject(created).set_value(prop.children(), std::move(value));
        return;
    }

    auto* obj = std::get_if<ObjectPtr>(&child);
    if (!obj) {
        throw ExecutorError(ErrorCode::REFLECTION_ERROR,
            std::format("Property '{}' of '{}' holds a {} and has no property '{}'",
                        prop.name(), root_->type_name(), value_type_name(child), prop.children()));
    }
    MetaObject(*obj).set_value(prop.children(), std::move(value));
}

} // namespace sqlmemo
