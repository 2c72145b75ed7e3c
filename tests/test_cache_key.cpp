#include <catch2/catch_test_macros.hpp>
#include "cache/cache_key.hpp"
#include "core/mapped_object.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <unordered_set>
#include <vector>

using namespace sqlmemo;

namespace {

CacheKey key_of(const std::vector<Value>& components) {
    CacheKey key;
    key.update_all(components.begin(), components.end());
    return key;
}

} // namespace

TEST_CASE("CacheKey: equal components give equal keys", "[cache_key]") {
    const std::vector<Value> components = {
        std::string("UserMapper.find"), int64_t{0}, int64_t{10},
        std::string("SELECT * FROM users WHERE id = ?"), int64_t{7}, std::string("dev")};

    const auto a = key_of(components);
    const auto b = key_of(components);

    CHECK(a == b);
    CHECK(a.hash() == b.hash());
    CHECK(std::hash<CacheKey>{}(a) == std::hash<CacheKey>{}(b));
    CHECK(a.update_count() == 6);
}

TEST_CASE("CacheKey: any differing component changes the key", "[cache_key]") {
    const std::vector<Value> base = {
        std::string("S1"), int64_t{0}, int64_t{10}, std::string("SELECT 1"), int64_t{7}, std::string("dev")};
    const std::vector<Value> replacements = {
        std::string("S2"), int64_t{1}, int64_t{11}, std::string("SELECT 2"), int64_t{8}, std::string("prod")};

    const auto reference = key_of(base);
    for (size_t i = 0; i < base.size(); ++i) {
        auto changed = base;
        changed[i] = replacements[i];
        INFO("component " << i);
        CHECK_FALSE(key_of(changed) == reference);
    }
}

TEST_CASE("CacheKey: order of components matters", "[cache_key]") {
    const auto ab = key_of({std::string("a"), std::string("b")});
    const auto ba = key_of({std::string("b"), std::string("a")});
    CHECK_FALSE(ab == ba);
    CHECK(ab.hash() != ba.hash());
}

TEST_CASE("CacheKey: permutations of distinct components are pairwise distinct", "[cache_key]") {
    std::vector<Value> components = {int64_t{1}, std::string("1"), Value{}, true};
    std::vector<size_t> order = {0, 1, 2, 3};

    std::vector<CacheKey> keys;
    do {
        CacheKey key;
        for (const auto i : order) key.update(components[i]);
        keys.push_back(key);
    } while (std::next_permutation(order.begin(), order.end()));

    REQUIRE(keys.size() == 24);
    for (size_t i = 0; i < keys.size(); ++i) {
        for (size_t j = i + 1; j < keys.size(); ++j) {
            CHECK_FALSE(keys[i] == keys[j]);
        }
    }
}

TEST_CASE("CacheKey: null is distinct from empty string and zero", "[cache_key]") {
    const auto null_key = key_of({Value{}});
    const auto empty_key = key_of({std::string()});
    const auto zero_key = key_of({int64_t{0}});
    const auto false_key = key_of({false});

    CHECK_FALSE(null_key == empty_key);
    CHECK_FALSE(null_key == zero_key);
    CHECK_FALSE(empty_key == zero_key);
    CHECK_FALSE(zero_key == false_key);
    CHECK(null_key.update_count() == 1);
}

TEST_CASE("CacheKey: integer and text forms of a value differ", "[cache_key]") {
    CHECK_FALSE(key_of({int64_t{7}}) == key_of({std::string("7")}));
    CHECK_FALSE(key_of({int64_t{7}}) == key_of({7.0}));
}

TEST_CASE("CacheKey: composite parameter values fold recursively", "[cache_key]") {
    auto make_param = [](int64_t id, const std::string& city) {
        auto address = MappedObject::create("Address");
        address->set_value("city", city);
        auto param = MappedObject::create("Query");
        param->set_value("id", id);
        param->set_value("address", address);
        return param;
    };

    const auto a = key_of({Value{make_param(1, "Oslo")}});
    const auto b = key_of({Value{make_param(1, "Oslo")}});
    const auto c = key_of({Value{make_param(1, "Bergen")}});

    CHECK(a == b);
    CHECK_FALSE(a == c);

    SECTION("Object marker never equals a plain string") {
        const auto obj = key_of({Value{MappedObject::create("Address")}});
        const auto str = key_of({std::string("Address")});
        CHECK_FALSE(obj == str);
    }

    SECTION("Lists fold element by element") {
        auto list1 = std::make_shared<ResultList>(ResultList{make_param(1, "Oslo"), make_param(2, "Oslo")});
        auto list2 = std::make_shared<ResultList>(ResultList{make_param(2, "Oslo"), make_param(1, "Oslo")});
        CHECK_FALSE(key_of({Value{list1}}) == key_of({Value{list2}}));
    }
}

TEST_CASE("CacheKey: self-referencing parameter graph terminates", "[cache_key]") {
    auto node = MappedObject::create("Node");
    node->set_value("id", int64_t{1});
    node->set_value("self", node);

    CacheKey key;
    key.update(node);
    CHECK(key.update_count() > 0);

    CacheKey again;
    again.update(node);
    CHECK(key == again);

    node->erase("self");
}

TEST_CASE("CacheKey: usable in unordered containers", "[cache_key]") {
    std::unordered_set<CacheKey> set;
    set.insert(key_of({std::string("S1"), int64_t{7}}));
    set.insert(key_of({std::string("S1"), int64_t{7}}));
    set.insert(key_of({std::string("S1"), int64_t{8}}));
    CHECK(set.size() == 2);
}

TEST_CASE("CacheKey: to_string lists components in order", "[cache_key]") {
    const auto key = key_of({std::string("S1"), int64_t{0}, Value{}});
    const auto text = key.to_string();
    CHECK(text.find(":S1:0:null") != std::string::npos);
}

TEST_CASE("CacheKey: NaN and signed zero parameters", "[cache_key]") {
    const double nan = std::numeric_limits<double>::quiet_NaN();

    SECTION("NaN key equals itself and an equal query") {
        const auto key = key_of({std::string("S1"), nan});
        CHECK(key == key_of({std::string("S1"), nan}));
        CHECK(key == key_of({std::string("S1"), -nan}));
        CHECK(key.hash() == key_of({std::string("S1"), -nan}).hash());
        CHECK_FALSE(key == key_of({std::string("S1"), 0.0}));
    }

    SECTION("Negative zero folds as zero") {
        const auto positive = key_of({std::string("S1"), 0.0});
        const auto negative = key_of({std::string("S1"), -0.0});
        CHECK(positive == negative);
        CHECK(positive.hash() == negative.hash());
    }

    SECTION("NaN key finds its memo slot") {
        std::unordered_set<CacheKey> set;
        set.insert(key_of({std::string("S1"), nan}));
        set.insert(key_of({std::string("S1"), nan}));
        CHECK(set.size() == 1);
        CHECK(set.contains(key_of({std::string("S1"), nan})));
    }
}
