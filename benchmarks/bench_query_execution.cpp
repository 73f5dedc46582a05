// Query execution against the in-memory and RocksDB row stores

#include <benchmark/benchmark.h>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include "query/cancellation_token.h"
#include "query/plan_builder.h"
#include "query/query_executor.h"
#include "storage/memory_row_store.h"
#include "storage/rocksdb_row_store.h"
#include "storage/sample_data.h"

using rolodex::EntityKind;
using rolodex::MemoryRowStore;
using rolodex::RocksDBRowStore;
using rolodex::RocksDBWrapper;
using rolodex::SampleDataGenerator;
using rolodex::query::CancellationToken;
using rolodex::query::QueryExecutor;
using rolodex::query::QueryPlanBuilder;
using rolodex::query::QueryPlanPtr;
using rolodex::query::RawParams;

namespace {
struct BenchEnv {
    std::shared_ptr<MemoryRowStore> memory;
    std::shared_ptr<RocksDBRowStore> rocks;
    bool ready = false;

    static BenchEnv& instance() {
        static BenchEnv env; return env;
    }

    void initOnce(int64_t users = 10000) {
        if (ready) return;
        SampleDataGenerator::Config gen; gen.users = users;
        SampleDataGenerator generator(gen);

        memory = std::make_shared<MemoryRowStore>();
        auto st = generator.seed(*memory);
        if (!st.ok()) throw std::runtime_error("Failed to seed memory store: " + st.message);

        const std::string db_path = "data/rolodex_bench_query";
        if (std::filesystem::exists(db_path)) {
            std::filesystem::remove_all(db_path);
        }
        RocksDBWrapper::Config cfg; cfg.db_path = db_path; cfg.memtable_size_mb = 128;
        rocks = std::make_shared<RocksDBRowStore>(cfg);
        if (!rocks->open()) {
            throw std::runtime_error("Failed to open RocksDB for benchmark");
        }
        st = generator.seed(*rocks);
        if (!st.ok()) throw std::runtime_error("Failed to seed RocksDB store: " + st.message);
        ready = true;
    }

    std::shared_ptr<rolodex::RowStore> store(int64_t which) const {
        if (which == 0) return memory;
        return rocks;
    }
};

QueryPlanPtr buildPlan(const RawParams& params) {
    static QueryPlanBuilder builder(rolodex::schema::SchemaRegistry::contacts());
    auto [st, plan] = builder.build(EntityKind::APP_USER, params);
    if (!st.ok()) throw std::runtime_error(st.toString());
    return plan;
}

void runPlan(benchmark::State& state, const RawParams& params) {
    auto& env = BenchEnv::instance(); env.initOnce();
    QueryExecutor executor(env.store(state.range(0)));
    auto plan = buildPlan(params);

    int64_t rows = 0;
    for (auto _ : state) {
        CancellationToken token(std::chrono::seconds(30));
        auto result = executor.execute(plan, token);
        if (!result.ok()) {
            state.SkipWithError(result.error.c_str());
            return;
        }
        rows = result.metrics.row_count;
    }
    state.counters["rows"] = static_cast<double>(rows);
    state.SetLabel(state.range(0) == 0 ? "memory" : "rocksdb");
}
} // namespace

// Arg: 0 = memory store, 1 = RocksDB store
static void BM_Execute_FilterByName(benchmark::State& state) {
    runPlan(state, {{"first_name__icontains", "John"}, {"ordering", "-created"}, {"page_size", "100"}});
}

static void BM_Execute_MultipleFilters(benchmark::State& state) {
    runPlan(state, {{"gender", "M"}, {"relationship__points__gte", "5000"},
                    {"address__country__icontains", "Germany"}});
}

static void BM_Execute_Search(benchmark::State& state) {
    runPlan(state, {{"search", "Berlin"}, {"page_size", "100"}});
}

static void BM_Execute_SortByRelation(benchmark::State& state) {
    runPlan(state, {{"ordering", "-relationship.points,last_name"}, {"page_size", "1000"}});
}

static void BM_Count_All(benchmark::State& state) {
    auto& env = BenchEnv::instance(); env.initOnce();
    QueryExecutor executor(env.store(state.range(0)));
    auto plan = buildPlan({});
    for (auto _ : state) {
        CancellationToken token(std::chrono::seconds(30));
        auto result = executor.count(plan, token);
        if (!result.ok()) { state.SkipWithError(result.error.c_str()); return; }
        benchmark::DoNotOptimize(result.total_count);
    }
    state.SetLabel(state.range(0) == 0 ? "memory" : "rocksdb");
}

BENCHMARK(BM_Execute_FilterByName)->Arg(0)->Arg(1)->Unit(benchmark::kMillisecond);
BENCHMARK(BM_Execute_MultipleFilters)->Arg(0)->Arg(1)->Unit(benchmark::kMillisecond);
BENCHMARK(BM_Execute_Search)->Arg(0)->Arg(1)->Unit(benchmark::kMillisecond);
BENCHMARK(BM_Execute_SortByRelation)->Arg(0)->Arg(1)->Unit(benchmark::kMillisecond);
BENCHMARK(BM_Count_All)->Arg(0)->Arg(1)->Unit(benchmark::kMillisecond);
