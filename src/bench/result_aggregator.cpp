#include "bench/result_aggregator.h"
#include "query/statistical_aggregator.h"
#include "utils/date_time.h"

#include <algorithm>
#include <unordered_map>

namespace rolodex {
namespace bench {

using query::StatisticalAggregator;

size_t ScenarioSummary::successes() const {
    auto it = status_counts.find(query::executionStatusToString(query::ExecutionStatus::SUCCESS));
    return it == status_counts.end() ? 0 : it->second;
}

nlohmann::json ScenarioSummary::toJson() const {
    return {
        {"scenario", scenario},
        {"runs", runs},
        {"status_counts", status_counts},
        {"duration_ms", duration_ms},
        {"mean_query_count", mean_query_count},
        {"mean_result_count", mean_result_count}
    };
}

nlohmann::json PaginationSummary::toJson() const {
    return {
        {"benchmark", scenario},
        {"page_size", page_size},
        {"total_items", total_items},
        {"total_pages", total_pages},
        {"pages_tested", pages_tested},
        {"total_items_fetched", total_items_fetched},
        {"total_time_ms", total_time_ms},
        {"avg_time_per_page_ms", avg_time_per_page_ms},
        {"min_time_per_page_ms", min_time_per_page_ms},
        {"max_time_per_page_ms", max_time_per_page_ms},
        {"total_queries", total_queries},
        {"avg_queries_per_page", avg_queries_per_page},
        {"pages", pages}
    };
}

const ScenarioSummary* BenchmarkReport::summary(const std::string& scenario) const {
    for (const auto& s : summaries_) {
        if (s.scenario == scenario) return &s;
    }
    return nullptr;
}

nlohmann::json BenchmarkReport::toJson() const {
    nlohmann::json runs = nlohmann::json::array();
    for (const auto& r : results_) {
        runs.push_back(r.toJson());
    }
    nlohmann::json summaries = nlohmann::json::array();
    for (const auto& s : summaries_) {
        summaries.push_back(s.toJson());
    }
    return {{"generated_at", generated_at_}, {"runs", std::move(runs)}, {"summaries", std::move(summaries)}};
}

nlohmann::json BenchmarkReport::chartSeries() const {
    nlohmann::json series = nlohmann::json::object();
    for (const auto& s : summaries_) {
        series[s.scenario] = {{"duration_ms", nlohmann::json::array()}, {"query_count", nlohmann::json::array()}};
    }
    for (const auto& r : results_) {
        if (!r.ok() || !series.contains(r.scenario)) continue;
        auto& entry = series[r.scenario];
        entry["duration_ms"].push_back(r.metrics.duration_ms);
        entry["query_count"].push_back(r.metrics.statement_count);
    }
    return series;
}

BenchmarkReport ResultAggregator::aggregate(std::vector<BenchmarkResult> results) {
    BenchmarkReport report;
    report.generated_at_ = utils::DateTime::nowIso();
    report.results_ = std::move(results);

    std::vector<std::string> order;
    std::unordered_map<std::string, std::vector<const BenchmarkResult*>> byScenario;
    for (const auto& r : report.results_) {
        auto [it, inserted] = byScenario.try_emplace(r.scenario);
        if (inserted) order.push_back(r.scenario);
        it->second.push_back(&r);
    }

    for (const auto& name : order) {
        const auto& runs = byScenario[name];
        report.summaries_.push_back(summarize(name, runs));

        bool paginated = std::any_of(runs.begin(), runs.end(),
                                     [](const BenchmarkResult* r) { return r->variant != PageVariant::NONE; });
        if (paginated) {
            report.pagination_.push_back(summarizePages(name, runs));
        }
    }
    return report;
}

ScenarioSummary ResultAggregator::summarize(const std::string& scenario,
                                            const std::vector<const BenchmarkResult*>& runs) {
    ScenarioSummary s;
    s.scenario = scenario;
    s.runs = runs.size();

    std::vector<double> durations;
    std::vector<double> queries;
    std::vector<double> rows;
    for (const auto* r : runs) {
        ++s.status_counts[query::executionStatusToString(r->status())];
        if (!r->ok()) continue;
        durations.push_back(r->metrics.duration_ms);
        queries.push_back(static_cast<double>(r->metrics.statement_count));
        rows.push_back(static_cast<double>(r->metrics.row_count));
    }

    s.duration_ms = StatisticalAggregator::summarize(durations);
    s.mean_query_count = StatisticalAggregator::calculateMean(queries);
    s.mean_result_count = StatisticalAggregator::calculateMean(rows);
    return s;
}

PaginationSummary ResultAggregator::summarizePages(const std::string& scenario,
                                                   const std::vector<const BenchmarkResult*>& runs) {
    PaginationSummary p;
    p.scenario = scenario;

    std::vector<double> times;
    std::vector<double> queries;
    for (const auto* r : runs) {
        if (r->plan && p.page_size == 0) {
            p.page_size = r->plan->pagination().page_size;
        }
        p.pages.push_back({
            {"page", r->page},
            {"variant", pageVariantToString(r->variant)},
            {"status", query::executionStatusToString(r->status())},
            {"duration_ms", r->metrics.duration_ms},
            {"query_count", r->metrics.statement_count},
            {"result_count", r->metrics.row_count}
        });
        if (!r->ok()) continue;

        if (r->metrics.total_count >= 0) {
            p.total_items = std::max(p.total_items, r->metrics.total_count);
        }
        p.pages_tested.push_back(r->page);
        p.total_items_fetched += r->metrics.row_count;
        p.total_time_ms += r->metrics.duration_ms;
        p.total_queries += r->metrics.statement_count;
        times.push_back(r->metrics.duration_ms);
        queries.push_back(static_cast<double>(r->metrics.statement_count));
    }

    if (p.page_size > 0) {
        p.total_pages = std::max<int64_t>(1, (p.total_items + p.page_size - 1) / p.page_size);
    }
    p.avg_time_per_page_ms = StatisticalAggregator::calculateMean(times);
    p.min_time_per_page_ms = StatisticalAggregator::calculateMin(times);
    p.max_time_per_page_ms = StatisticalAggregator::calculateMax(times);
    p.avg_queries_per_page = StatisticalAggregator::calculateMean(queries);
    return p;
}

} // namespace bench
} // namespace rolodex
