#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "bench/scenario.h"

namespace rolodex {
namespace bench {

/// Per-scenario statistics. Duration and count statistics cover SUCCESS runs only.
struct ScenarioSummary {
    std::string scenario;
    size_t runs = 0;
    std::map<std::string, size_t> status_counts;   // status name -> runs
    nlohmann::json duration_ms;                    // StatisticalAggregator::summarize
    nlohmann::json mean_query_count;               // null without successes
    nlohmann::json mean_result_count;

    size_t successes() const;
    nlohmann::json toJson() const;
};

/// Page-by-page view of a scenario with pagination variants.
struct PaginationSummary {
    std::string scenario;
    int64_t page_size = 0;
    int64_t total_items = 0;
    int64_t total_pages = 0;
    std::vector<int64_t> pages_tested;
    int64_t total_items_fetched = 0;
    double total_time_ms = 0.0;
    nlohmann::json avg_time_per_page_ms;
    nlohmann::json min_time_per_page_ms;
    nlohmann::json max_time_per_page_ms;
    int64_t total_queries = 0;
    nlohmann::json avg_queries_per_page;
    nlohmann::json pages = nlohmann::json::array();   // one object per run

    nlohmann::json toJson() const;
};

/// Runs plus their derived summaries; immutable once built by ResultAggregator.
class BenchmarkReport {
public:
    const std::string& generatedAt() const { return generated_at_; }
    const std::vector<BenchmarkResult>& results() const { return results_; }
    const std::vector<ScenarioSummary>& summaries() const { return summaries_; }
    const std::vector<PaginationSummary>& paginationSummaries() const { return pagination_; }

    /// nullptr for an unknown scenario
    const ScenarioSummary* summary(const std::string& scenario) const;

    /// {generated_at, runs[], summaries[]}
    nlohmann::json toJson() const;

    /// {scenario: {duration_ms: [...], query_count: [...]}} over SUCCESS runs
    nlohmann::json chartSeries() const;

private:
    friend class ResultAggregator;

    std::string generated_at_;
    std::vector<BenchmarkResult> results_;
    std::vector<ScenarioSummary> summaries_;
    std::vector<PaginationSummary> pagination_;
};

/// Folds harness results into a BenchmarkReport; scenarios keep first-seen order.
class ResultAggregator {
public:
    static BenchmarkReport aggregate(std::vector<BenchmarkResult> results);

    static ScenarioSummary summarize(const std::string& scenario, const std::vector<const BenchmarkResult*>& runs);
    static PaginationSummary summarizePages(const std::string& scenario,
                                            const std::vector<const BenchmarkResult*>& runs);
};

} // namespace bench
} // namespace rolodex
