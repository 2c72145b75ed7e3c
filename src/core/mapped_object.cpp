#include "core/mapped_object.hpp"

#include <algorithm>
#include <unordered_set>

namespace sqlmemo {

namespace {

void push_reachable(const Value& v, std::vector<const MappedObject*>& stack,
                    std::unordered_set<const void*>& seen) {
    if (const auto* obj = std::get_if<ObjectPtr>(&v)) {
        if (*obj) stack.push_back(obj->get());
    } else if (const auto* list = std::get_if<ResultListPtr>(&v)) {
        if (!*list || !seen.insert(list->get()).second) return;
        for (const auto& element : **list) {
            if (element) stack.push_back(element.get());
        }
    }
}

} // anonymous namespace

bool value_reaches(const Value& value, const MappedObject* target) {
    if (!target || is_scalar(value)) return false;

    std::vector<const MappedObject*> stack;
    std::unordered_set<const void*> seen;
    push_reachable(value, stack, seen);
    while (!stack.empty()) {
        const auto* obj = stack.back();
        stack.pop_back();
        if (obj == target) return true;
        if (!seen.insert(obj).second) continue;
        for (const auto& [name, child] : obj->properties()) {
            push_reachable(child, stack, seen);
        }
    }
    return false;
}

MappedObject::MappedObject(std::string type_name)
    : type_name_(std::move(type_name)) {}

ObjectPtr MappedObject::create(std::string type_name) {
    return std::make_shared<MappedObject>(std::move(type_name));
}

const Value* MappedObject::find(std::string_view name) const {
    const auto it = std::find_if(properties_.begin(), properties_.end(),
        [name](const auto& p) { return p.first == name; });
    return it != properties_.end() ? &it->second : nullptr;
}

Value* MappedObject::find_mutable(std::string_view name) {
    const auto it = std::find_if(properties_.begin(), properties_.end(),
        [name](const auto& p) { return p.first == name; });
    return it != properties_.end() ? &it->second : nullptr;
}

Value MappedObject::peek(std::string_view name) const {
    if (const auto* v = find(name)) return *v;
    const auto it = std::find_if(back_references_.begin(), back_references_.end(),
        [name](const auto& r) { return r.first == name; });
    if (it == back_references_.end()) return {};
    return std::visit([](const auto& weak) -> Value { return weak.lock(); }, it->second);
}

bool MappedObject::has(std::string_view name) const {
    return find(name) != nullptr || is_back_reference(name);
}

bool MappedObject::is_back_reference(std::string_view name) const {
    return std::any_of(back_references_.begin(), back_references_.end(),
        [name](const auto& r) { return r.first == name; });
}

Value MappedObject::get_value(std::string_view name) {
    const auto it = lazy_loaders_.find(std::string(name));
    if (it != lazy_loaders_.end()) {
        // Detached before it runs; a failed load is not retried
        auto loader = std::move(it->second);
        lazy_loaders_.erase(it);
        set_value(name, loader->load());
    }
    return peek(name);
}

void MappedObject::set_value(std::string_view name, Value value) {
    lazy_loaders_.erase(std::string(name));

    if (value_reaches(value, this)) {
        erase_property(name);
        BackReference reference;
        if (const auto* obj = std::get_if<ObjectPtr>(&value)) {
            reference = std::weak_ptr<MappedObject>(*obj);
        } else {
            reference = std::weak_ptr<ResultList>(std::get<ResultListPtr>(value));
        }
        const auto it = std::find_if(back_references_.begin(), back_references_.end(),
            [name](const auto& r) { return r.first == name; });
        if (it != back_references_.end()) {
            it->second = std::move(reference);
        } else {
            back_references_.emplace_back(std::string(name), std::move(reference));
        }
        return;
    }

    erase_back_reference(name);
    if (auto* existing = find_mutable(name)) {
        *existing = std::move(value);
        return;
    }
    properties_.emplace_back(std::string(name), std::move(value));
}

bool MappedObject::erase(std::string_view name) {
    const bool owned = erase_property(name);
    const bool referenced = erase_back_reference(name);
    return owned || referenced;
}

bool MappedObject::erase_property(std::string_view name) {
    const auto it = std::find_if(properties_.begin(), properties_.end(),
        [name](const auto& p) { return p.first == name; });
    if (it == properties_.end()) return false;
    properties_.erase(it);
    return true;
}

bool MappedObject::erase_back_reference(std::string_view name) {
    const auto it = std::find_if(back_references_.begin(), back_references_.end(),
        [name](const auto& r) { return r.first == name; });
    if (it == back_references_.end()) return false;
    back_references_.erase(it);
    return true;
}

void MappedObject::add_lazy_loader(std::string_view name, std::shared_ptr<ILazyLoader> loader) {
    if (!loader) return;
    lazy_loaders_[std::string(name)] = std::move(loader);
}

bool MappedObject::has_lazy_loader(std::string_view name) const {
    return lazy_loaders_.contains(std::string(name));
}

void MappedObject::load_all() {
    std::vector<std::string> names;
    names.reserve(lazy_loaders_.size());
    for (const auto& [name, _] : lazy_loaders_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    for (const auto& name : names) {
        (void)get_value(name);
    }
}

} // namespace sqlmemo
