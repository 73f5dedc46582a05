// Plan compilation: raw request parameters -> validated QueryPlan

#include <benchmark/benchmark.h>
#include <string>

#include "query/plan_builder.h"
#include "schema/schema_registry.h"

using rolodex::schema::EntityKind;
using rolodex::query::QueryPlanBuilder;
using rolodex::query::RawParams;

static void BM_BuildPlan_Empty(benchmark::State& state) {
    QueryPlanBuilder builder(rolodex::schema::SchemaRegistry::contacts());
    RawParams params;
    for (auto _ : state) {
        auto [st, plan] = builder.build(EntityKind::APP_USER, params);
        if (!st.ok()) { state.SkipWithError(st.toString().c_str()); return; }
        benchmark::DoNotOptimize(plan);
    }
}

static void BM_BuildPlan_Complex(benchmark::State& state) {
    QueryPlanBuilder builder(rolodex::schema::SchemaRegistry::contacts());
    RawParams params{
        {"first_name__icontains", "John"},
        {"gender", "M"},
        {"relationship__points__gte", "1000"},
        {"address__country__icontains", "Germany"},
        {"ordering", "-relationship.points,last_name,-created"},
        {"search", "Berlin"},
        {"page", "3"},
        {"page_size", "100"},
    };
    for (auto _ : state) {
        auto [st, plan] = builder.build(EntityKind::APP_USER, params);
        if (!st.ok()) { state.SkipWithError(st.toString().c_str()); return; }
        benchmark::DoNotOptimize(plan);
    }
}

static void BM_BuildPlan_Rejected(benchmark::State& state) {
    QueryPlanBuilder builder(rolodex::schema::SchemaRegistry::contacts());
    RawParams params{{"gender", "M"}, {"ordering", "-nonexistent"}};
    for (auto _ : state) {
        auto [st, plan] = builder.build(EntityKind::APP_USER, params);
        benchmark::DoNotOptimize(st);
    }
}

static void BM_SplitFilterKey(benchmark::State& state) {
    for (auto _ : state) {
        auto parts = QueryPlanBuilder::splitFilterKey("relationship__points__gte");
        benchmark::DoNotOptimize(parts);
    }
}

BENCHMARK(BM_BuildPlan_Empty);
BENCHMARK(BM_BuildPlan_Complex);
BENCHMARK(BM_BuildPlan_Rejected);
BENCHMARK(BM_SplitFilterKey);
