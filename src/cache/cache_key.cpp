#include "cache/cache_key.hpp"
#include "core/mapped_object.hpp"

#define XXH_INLINE_ALL
#include <xxhash.h>

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstring>
#include <format>
#include <limits>
#include <type_traits>

namespace sqlmemo {

namespace {

// Serialized form of one component: tag byte followed by a fixed or
// length-prefixed payload. The tag keeps null, "" and 0 apart.
template<typename T>
void append_raw(std::string& buf, const T& v) {
    char bytes[sizeof(T)];
    std::memcpy(bytes, &v, sizeof(T));
    buf.append(bytes, sizeof(T));
}

std::string serialize(const CacheKey::Component& c) {
    std::string buf;
    buf.push_back(static_cast<char>(c.index()));
    std::visit([&buf](const auto& x) {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            // tag only
        } else if constexpr (std::is_same_v<T, bool>) {
            buf.push_back(x ? '\1' : '\0');
        } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double>) {
            append_raw(buf, x);
        } else if constexpr (std::is_same_v<T, std::string>) {
            append_raw(buf, static_cast<uint64_t>(x.size()));
            buf += x;
        } else {
            buf.push_back(x.kind);
            append_raw(buf, static_cast<uint64_t>(x.label.size()));
            buf += x.label;
            append_raw(buf, static_cast<uint64_t>(x.size));
        }
    }, c);
    return buf;
}

// Walks a Value into flat components. Tracks the objects on the current
// path so self-referencing parameter graphs terminate.
class Folder {
public:
    explicit Folder(const std::function<void(CacheKey::Component)>& sink) : sink_(sink) {}

    void fold(const Value& v) {
        std::visit([this](const auto& x) {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, ObjectPtr>) {
                fold_object(x);
            } else if constexpr (std::is_same_v<T, ResultListPtr>) {
                fold_list(x);
            } else {
                sink_(x);
            }
        }, v);
    }

private:
    void fold_object(const ObjectPtr& obj) {
        if (!obj) {
            sink_(std::monostate{});
            return;
        }
        if (std::find(path_.begin(), path_.end(), obj.get()) != path_.end()) {
            sink_(CacheKey::CompositeMarker{'r', obj->type_name(), 0});
            return;
        }
        path_.push_back(obj.get());
        // Only materialized properties: building a key never triggers I/O
        sink_(CacheKey::CompositeMarker{'o', obj->type_name(), obj->properties().size()});
        for (const auto& [name, value] : obj->properties()) {
            sink_(name);
            fold(value);
        }
        path_.pop_back();
    }

    void fold_list(const ResultListPtr& list) {
        if (!list) {
            sink_(std::monostate{});
            return;
        }
        sink_(CacheKey::CompositeMarker{'l', {}, list->size()});
        for (const auto& element : *list) {
            fold_object(element);
        }
    }

    const std::function<void(CacheKey::Component)>& sink_;
    std::vector<const MappedObject*> path_;
};

// One bit pattern per value: every NaN folds to the same quiet NaN and
// -0.0 folds to 0.0
double canonical_double(double d) {
    if (std::isnan(d)) return std::numeric_limits<double>::quiet_NaN();
    if (d == 0.0) return 0.0;
    return d;
}

// Doubles compare by bit pattern so a NaN component equals itself
bool same_component(const CacheKey::Component& a, const CacheKey::Component& b) {
    if (a.index() != b.index()) return false;
    if (const auto* x = std::get_if<double>(&a)) {
        return std::bit_cast<uint64_t>(*x) == std::bit_cast<uint64_t>(std::get<double>(b));
    }
    return a == b;
}

std::string component_to_string(const CacheKey::Component& c) {
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
        } else {
            return std::format("<{}:{}:{}>", x.kind, x.label, x.size);
        }
    }, c);
}

} // anonymous namespace

void CacheKey::update(const Value& value) {
    const std::function<void(Component)> sink = [this](Component c) { fold(std::move(c)); };
    Folder(sink).fold(value);
}

void CacheKey::fold(Component component) {
    if (auto* d = std::get_if<double>(&component)) {
        *d = canonical_double(*d);
    }
    const auto bytes = serialize(component);
    hash_ = XXH64(bytes.data(), bytes.size(), hash_);
    checksum_ += XXH64(bytes.data(), bytes.size(), 0);
    components_.push_back(std::move(component));
}

bool CacheKey::operator==(const CacheKey& other) const {
    if (this == &other) return true;
    if (hash_ != other.hash_) return false;
    if (checksum_ != other.checksum_) return false;
    if (components_.size() != other.components_.size()) return false;
    return std::equal(components_.begin(), components_.end(),
                      other.components_.begin(), same_component);
}

std::string CacheKey::to_string() const {
    std::string out = std::format("{}:{}", hash_, checksum_);
    for (const auto& c : components_) {
        out += ':';
        out += component_to_string(c);
    }
    return out;
}

} // namespace sqlmemo
