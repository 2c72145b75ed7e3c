#include <benchmark/benchmark.h>

#include "cache/cache_key.hpp"
#include "cache/local_cache.hpp"
#include "config/configuration.hpp"
#include "core/mapped_object.hpp"
#include "executor/executor.hpp"
#include "mocks/mock_statement_backend.hpp"
#include "mocks/mock_transaction.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace sqlmemo;
using namespace sqlmemo::testing;

// ============================================================================
// Helpers
// ============================================================================

namespace {

const std::string kFindUser = "SELECT id, name, email FROM users WHERE id = $1 AND status = $2";

std::shared_ptr<Configuration> make_config() {
    auto config = std::make_shared<Configuration>();
    config->set_statement_backend(std::make_shared<MockStatementBackend>());
    config->set_environment(Environment{"bench", nullptr, nullptr});

    MappedStatement find;
    find.id = "UserMapper.find";
    find.result_type = "User";
    find.sql_source = std::make_shared<StaticSqlSource>(
        kFindUser, std::vector<ParameterMapping>{{"id"}, {"status"}});
    config->add_statement(find);
    return config;
}

ObjectPtr make_param(int64_t id) {
    auto param = MappedObject::create("UserQuery");
    param->set_value("id", id);
    param->set_value("status", std::string("active"));
    return param;
}

CacheKey make_key(int64_t id) {
    CacheKey key;
    key.update(std::string("UserMapper.find"));
    key.update(int64_t{0});
    key.update(int64_t{RowBounds::NO_ROW_LIMIT});
    key.update(kFindUser);
    key.update(id);
    key.update(std::string("active"));
    key.update(std::string("bench"));
    return key;
}

} // anonymous namespace

// ============================================================================
// Fingerprints
// ============================================================================

// Fold the components of one invocation
static void BM_CacheKey_Build(benchmark::State& state) {
    for (auto _ : state) {
        auto key = make_key(42);
        benchmark::DoNotOptimize(key);
    }
}
BENCHMARK(BM_CacheKey_Build);

static void BM_CacheKey_Equality(benchmark::State& state) {
    const auto a = make_key(42);
    const auto b = make_key(42);
    for (auto _ : state) {
        bool equal = (a == b);
        benchmark::DoNotOptimize(equal);
    }
}
BENCHMARK(BM_CacheKey_Equality);

// Executor path: bind parameters, then fold
static void BM_Executor_CreateCacheKey(benchmark::State& state) {
    auto config = make_config();
    auto executor = Executor::create(config, std::make_unique<MockTransaction>());
    const auto statement = config->statement("UserMapper.find");
    const auto param = make_param(42);
    for (auto _ : state) {
        const auto bound_sql = statement->bound_sql(param);
        auto key = executor->create_cache_key(*statement, param, RowBounds{}, bound_sql);
        benchmark::DoNotOptimize(key);
    }
}
BENCHMARK(BM_Executor_CreateCacheKey);

// ============================================================================
// Session memo
// ============================================================================

static void BM_LocalCache_Hit(benchmark::State& state) {
    ResultMemo memo("LocalCache");
    const auto n = state.range(0);
    for (int64_t i = 0; i < n; ++i) {
        memo.put(make_key(i), std::make_shared<ResultList>());
    }
    const auto key = make_key(n / 2);
    for (auto _ : state) {
        const auto* hit = memo.find_resolved(key);
        benchmark::DoNotOptimize(hit);
    }
}
BENCHMARK(BM_LocalCache_Hit)->Arg(10)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_LocalCache_PendingThenResolve(benchmark::State& state) {
    ResultMemo memo("LocalCache");
    const auto list = std::make_shared<ResultList>();
    int64_t i = 0;
    for (auto _ : state) {
        const auto key = make_key(i++);
        memo.put_pending(key);
        memo.put(key, list);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_LocalCache_PendingThenResolve);

// Repeated query served from the memo after the first fetch
static void BM_Executor_MemoHit(benchmark::State& state) {
    auto config = make_config();
    auto executor = Executor::create(config, std::make_unique<MockTransaction>());
    const auto statement = config->statement("UserMapper.find");
    const auto param = make_param(42);
    executor->query(*statement, param);
    for (auto _ : state) {
        auto list = executor->query(*statement, param);
        benchmark::DoNotOptimize(list);
    }
}
BENCHMARK(BM_Executor_MemoHit);

// Distinct fingerprints, each fetched once
static void BM_Executor_MemoMiss(benchmark::State& state) {
    auto config = make_config();
    auto executor = Executor::create(config, std::make_unique<MockTransaction>());
    const auto statement = config->statement("UserMapper.find");
    int64_t id = 0;
    for (auto _ : state) {
        auto list = executor->query(*statement, make_param(id++));
        benchmark::DoNotOptimize(list);
    }
}
BENCHMARK(BM_Executor_MemoMiss);
