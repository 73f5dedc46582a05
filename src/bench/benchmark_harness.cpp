#include "bench/benchmark_harness.h"
#include "utils/date_time.h"
#include "utils/logger.h"

#include <algorithm>
#include <iterator>
#include <fmt/format.h>

namespace rolodex {
namespace bench {

BenchmarkHarness::BenchmarkHarness(const query::QueryExecutor& executor)
    : BenchmarkHarness(executor, Config{}) {}

BenchmarkHarness::BenchmarkHarness(const query::QueryExecutor& executor, Config config)
    : executor_(executor), config_(config), rng_(config.seed) {
    config_.repetitions = std::max(1, config_.repetitions);
}

std::vector<BenchmarkResult> BenchmarkHarness::run(const std::vector<BenchmarkScenario>& scenarios) {
    std::vector<BenchmarkResult> results;
    for (const auto& scenario : scenarios) {
        auto scenarioResults = runScenario(scenario);
        results.insert(results.end(), std::make_move_iterator(scenarioResults.begin()),
                       std::make_move_iterator(scenarioResults.end()));
    }
    return results;
}

std::vector<BenchmarkResult> BenchmarkHarness::runScenario(const BenchmarkScenario& scenario) {
    std::vector<BenchmarkResult> results;
    if (!scenario.plan) {
        ROLODEX_ERROR("Scenario '{}' has no plan; skipped", scenario.name);
        return results;
    }

    const int repetitions = scenario.repetitions > 0 ? scenario.repetitions : config_.repetitions;
    ROLODEX_INFO("================================================================================");
    ROLODEX_INFO("Benchmark: {} ({} repetition(s))", scenario.description.empty() ? scenario.name : scenario.description,
                 repetitions);
    ROLODEX_INFO("================================================================================");

    for (int i = 0; i < repetitions; ++i) {
        if (scenario.hasPageVariants()) {
            runPaginated(scenario, i, results);
        } else {
            auto plan = std::make_shared<const query::QueryPlan>(*scenario.plan);
            results.push_back(runOnce(scenario, std::move(plan), i, PageVariant::NONE, 0));
        }
    }
    return results;
}

void BenchmarkHarness::runPaginated(const BenchmarkScenario& scenario, int run_index,
                                    std::vector<BenchmarkResult>& out) {
    query::CancellationToken countToken(config_.run_deadline);
    auto counted = executor_.count(std::make_shared<const query::QueryPlan>(*scenario.plan), countToken);

    if (!counted.ok()) {
        ROLODEX_WARN("[{}] count failed ({}): {}", scenario.name,
                     query::executionStatusToString(counted.status), counted.error);
        // Every page of this repetition depends on the count
        for (PageVariant variant : scenario.page_variants) {
            BenchmarkResult r;
            r.scenario = scenario.name;
            r.run_index = run_index;
            r.plan = scenario.plan;
            r.metrics = counted.metrics;
            r.variant = variant;
            r.error = "page count unavailable: " + counted.error;
            r.timestamp = utils::DateTime::nowIso();
            logResult(r);
            out.push_back(std::move(r));
        }
        return;
    }

    const int64_t total = std::max<int64_t>(0, counted.total_count);
    const int64_t pages = scenario.plan->pagination().pageCount(total);
    ROLODEX_INFO("[{}] total items: {}, total pages: {}", scenario.name, total, pages);

    for (PageVariant variant : scenario.page_variants) {
        int64_t page = 1;
        switch (variant) {
            case PageVariant::NONE:
            case PageVariant::FIRST:
                page = 1;
                break;
            case PageVariant::MIDDLE:
                page = std::max<int64_t>(1, pages / 2);
                break;
            case PageVariant::LAST:
                page = pages;
                break;
            case PageVariant::RANDOM:
                page = std::uniform_int_distribution<int64_t>(1, pages)(rng_);
                break;
        }
        auto plan = std::make_shared<const query::QueryPlan>(scenario.plan->withPage(page));
        out.push_back(runOnce(scenario, std::move(plan), run_index, variant, page));
    }
}

BenchmarkResult BenchmarkHarness::runOnce(const BenchmarkScenario& scenario, query::QueryPlanPtr plan,
                                          int run_index, PageVariant variant, int64_t page) {
    BenchmarkResult r;
    r.scenario = scenario.name;
    r.run_index = run_index;
    r.variant = variant;
    r.page = page;
    r.timestamp = utils::DateTime::nowIso();

    query::CancellationToken token(config_.run_deadline);
    auto executed = executor_.execute(plan, token, true);
    r.plan = std::move(plan);
    r.metrics = executed.metrics;
    r.error = executed.error;

    logResult(r);
    return r;
}

void BenchmarkHarness::logResult(const BenchmarkResult& r) {
    std::string where = r.variant == PageVariant::NONE
        ? fmt::format("[{}] run {}", r.scenario, r.run_index)
        : fmt::format("[{}] run {} page {} ({})", r.scenario, r.run_index, r.page, pageVariantToString(r.variant));

    switch (r.status()) {
        case query::ExecutionStatus::SUCCESS:
            ROLODEX_INFO("{}: Execution Time: {:.2f} ms, Query Count: {}, Results Count: {}", where,
                         r.metrics.duration_ms, r.metrics.statement_count, r.metrics.row_count);
            break;
        case query::ExecutionStatus::TIMED_OUT:
            ROLODEX_WARN("{}: Execution Time: {:.2f} ms, ERROR: Query timed out (exceeded statement timeout)",
                         where, r.metrics.duration_ms);
            break;
        default:
            ROLODEX_WARN("{}: Execution Time: {:.2f} ms, ERROR ({}): {}", where, r.metrics.duration_ms,
                         query::executionStatusToString(r.status()), r.error);
            break;
    }
}

} // namespace bench
} // namespace rolodex
