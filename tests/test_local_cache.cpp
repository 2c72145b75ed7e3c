#include <catch2/catch_test_macros.hpp>
#include "cache/local_cache.hpp"
#include "core/mapped_object.hpp"

#include <limits>
#include <string>

using namespace sqlmemo;

namespace {

CacheKey make_key(const std::string& id) {
    CacheKey key;
    key.update(id);
    return key;
}

} // namespace

TEST_CASE("LocalCache: absent, pending and resolved states", "[local_cache]") {
    LocalCache<int> cache("test");
    const auto key = make_key("S1");

    CHECK_FALSE(cache.get(key).has_value());
    CHECK_FALSE(cache.contains(key));

    cache.put_pending(key);
    REQUIRE(cache.get(key).has_value());
    CHECK(std::holds_alternative<ExecutionPlaceholder>(*cache.get(key)));
    CHECK(cache.is_pending(key));
    CHECK_FALSE(cache.is_resolved(key));
    CHECK(cache.find_resolved(key) == nullptr);

    cache.put(key, 42);
    CHECK(cache.is_resolved(key));
    CHECK_FALSE(cache.is_pending(key));
    REQUIRE(cache.find_resolved(key) != nullptr);
    CHECK(*cache.find_resolved(key) == 42);
    CHECK(cache.size() == 1);
}

TEST_CASE("LocalCache: keys keep insertion order", "[local_cache]") {
    LocalCache<int> cache("test");
    const auto a = make_key("a");
    const auto b = make_key("b");
    const auto c = make_key("c");

    cache.put_pending(a);
    cache.put(b, 2);
    cache.put(c, 3);
    cache.put(a, 1);    // Resolving keeps the original position

    const auto keys = cache.keys();
    REQUIRE(keys.size() == 3);
    CHECK(keys[0] == a);
    CHECK(keys[1] == b);
    CHECK(keys[2] == c);
}

TEST_CASE("LocalCache: remove and clear", "[local_cache]") {
    LocalCache<int> cache("test");
    const auto a = make_key("a");
    const auto b = make_key("b");
    cache.put(a, 1);
    cache.put(b, 2);

    CHECK(cache.remove(a));
    CHECK_FALSE(cache.remove(a));
    CHECK_FALSE(cache.contains(a));
    CHECK(cache.contains(b));

    cache.clear();
    CHECK(cache.empty());
    CHECK(cache.keys().empty());
}

TEST_CASE("LocalCache: holds shared result lists by identity", "[local_cache]") {
    LocalCache<ResultListPtr> cache("LocalCache");
    const auto key = make_key("S1");
    auto list = std::make_shared<ResultList>(ResultList{MappedObject::create("User")});

    cache.put(key, list);
    REQUIRE(cache.find_resolved(key) != nullptr);
    CHECK(cache.find_resolved(key)->get() == list.get());
    CHECK(cache.id() == "LocalCache");
}

TEST_CASE("LocalCache: NaN parameter reuses one slot", "[local_cache]") {
    LocalCache<int> cache("test");
    CacheKey key;
    key.update(std::string("S1"));
    key.update(std::numeric_limits<double>::quiet_NaN());

    cache.put_pending(key);
    cache.put(key, 7);
    CHECK(cache.size() == 1);
    REQUIRE(cache.find_resolved(key) != nullptr);
    CHECK(*cache.find_resolved(key) == 7);

    cache.put_pending(key);
    CHECK(cache.remove(key));
    CHECK(cache.empty());
}
