#include <gtest/gtest.h>
#include "bench/result_aggregator.h"

#include <cmath>

using namespace rolodex;
using namespace rolodex::bench;
using query::ExecutionStatus;

namespace {

BenchmarkResult run(const std::string& scenario, int index, ExecutionStatus status, double ms,
                    uint32_t queries = 2, int64_t rows = 10) {
    BenchmarkResult r;
    r.scenario = scenario;
    r.run_index = index;
    r.metrics.status = status;
    r.metrics.duration_ms = ms;
    r.metrics.statement_count = queries;
    r.metrics.row_count = rows;
    r.metrics.total_count = 100;
    r.timestamp = "2026-01-01T00:00:00Z";
    return r;
}

} // namespace

TEST(ResultAggregatorTest, SuccessfulRunStatistics) {
    std::vector<BenchmarkResult> results;
    for (int i = 0; i < 5; ++i) {
        results.push_back(run("search", i, ExecutionStatus::SUCCESS, 10.0 * (i + 1)));
    }
    auto report = ResultAggregator::aggregate(std::move(results));

    const auto* s = report.summary("search");
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->runs, 5u);
    EXPECT_EQ(s->successes(), 5u);
    EXPECT_DOUBLE_EQ(s->duration_ms["median"].get<double>(), 30.0);
    EXPECT_DOUBLE_EQ(s->duration_ms["mean"].get<double>(), 30.0);
    EXPECT_DOUBLE_EQ(s->duration_ms["min"].get<double>(), 10.0);
    EXPECT_DOUBLE_EQ(s->duration_ms["max"].get<double>(), 50.0);
    EXPECT_DOUBLE_EQ(s->mean_query_count.get<double>(), 2.0);
    EXPECT_DOUBLE_EQ(s->mean_result_count.get<double>(), 10.0);
}

TEST(ResultAggregatorTest, FailedRunsOnlyCountTowardsStatus) {
    std::vector<BenchmarkResult> results = {
        run("complex_query", 0, ExecutionStatus::SUCCESS, 10.0),
        run("complex_query", 1, ExecutionStatus::TIMED_OUT, 30000.0, 0, 0),
        run("complex_query", 2, ExecutionStatus::SUCCESS, 20.0),
        run("complex_query", 3, ExecutionStatus::EXECUTION_FAILED, 1.0, 0, 0),
    };
    auto report = ResultAggregator::aggregate(std::move(results));

    const auto* s = report.summary("complex_query");
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->runs, 4u);
    EXPECT_EQ(s->status_counts.at("success"), 2u);
    EXPECT_EQ(s->status_counts.at("timed_out"), 1u);
    EXPECT_EQ(s->status_counts.at("execution_failed"), 1u);
    EXPECT_DOUBLE_EQ(s->duration_ms["max"].get<double>(), 20.0);
    EXPECT_DOUBLE_EQ(s->duration_ms["mean"].get<double>(), 15.0);
}

TEST(ResultAggregatorTest, NoSuccessMeansNullStatistics) {
    auto report = ResultAggregator::aggregate({run("slow", 0, ExecutionStatus::TIMED_OUT, 5000.0)});
    const auto* s = report.summary("slow");
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->successes(), 0u);
    EXPECT_TRUE(s->duration_ms["mean"].is_null());
    EXPECT_TRUE(s->mean_query_count.is_null());
}

TEST(ResultAggregatorTest, ScenariosKeepFirstSeenOrder) {
    auto report = ResultAggregator::aggregate({
        run("b", 0, ExecutionStatus::SUCCESS, 1.0),
        run("a", 0, ExecutionStatus::SUCCESS, 1.0),
        run("b", 1, ExecutionStatus::SUCCESS, 1.0),
    });
    ASSERT_EQ(report.summaries().size(), 2u);
    EXPECT_EQ(report.summaries()[0].scenario, "b");
    EXPECT_EQ(report.summaries()[1].scenario, "a");
    EXPECT_EQ(report.summary("missing"), nullptr);
}

TEST(ResultAggregatorTest, ReportJsonLayout) {
    auto report = ResultAggregator::aggregate({run("search", 0, ExecutionStatus::SUCCESS, 12.0)});
    auto j = report.toJson();
    ASSERT_TRUE(j.contains("generated_at"));
    ASSERT_EQ(j["runs"].size(), 1u);
    ASSERT_EQ(j["summaries"].size(), 1u);
    EXPECT_EQ(j["runs"][0]["scenario"], "search");
    EXPECT_EQ(j["summaries"][0]["scenario"], "search");
}

TEST(ResultAggregatorTest, ChartSeriesHoldOnlySuccessfulNumbers) {
    auto report = ResultAggregator::aggregate({
        run("search", 0, ExecutionStatus::SUCCESS, 12.0, 2),
        run("search", 1, ExecutionStatus::CANCELLED, 3.0, 0),
        run("search", 2, ExecutionStatus::SUCCESS, 14.0, 2),
    });
    auto series = report.chartSeries();
    ASSERT_TRUE(series.contains("search"));
    EXPECT_EQ(series["search"]["duration_ms"], (nlohmann::json{12.0, 14.0}));
    EXPECT_EQ(series["search"]["query_count"], (nlohmann::json{2, 2}));
}

TEST(ResultAggregatorTest, PaginationSummary) {
    std::vector<BenchmarkResult> results;
    const int64_t pages[] = {1, 5, 10};
    const PageVariant variants[] = {PageVariant::FIRST, PageVariant::MIDDLE, PageVariant::LAST};
    for (int i = 0; i < 3; ++i) {
        auto r = run("pagination_selected_pages", 0, ExecutionStatus::SUCCESS, 10.0 * (i + 1), 2, 100);
        r.metrics.total_count = 1000;
        r.variant = variants[i];
        r.page = pages[i];
        results.push_back(r);
    }
    auto report = ResultAggregator::aggregate(std::move(results));

    ASSERT_EQ(report.paginationSummaries().size(), 1u);
    const auto& p = report.paginationSummaries()[0];
    EXPECT_EQ(p.scenario, "pagination_selected_pages");
    EXPECT_EQ(p.total_items, 1000);
    EXPECT_EQ(p.pages_tested, (std::vector<int64_t>{1, 5, 10}));
    EXPECT_EQ(p.total_items_fetched, 300);
    EXPECT_DOUBLE_EQ(p.total_time_ms, 60.0);
    EXPECT_DOUBLE_EQ(p.avg_time_per_page_ms.get<double>(), 20.0);
    EXPECT_DOUBLE_EQ(p.min_time_per_page_ms.get<double>(), 10.0);
    EXPECT_DOUBLE_EQ(p.max_time_per_page_ms.get<double>(), 30.0);
    EXPECT_EQ(p.total_queries, 6);
    EXPECT_EQ(p.pages.size(), 3u);

    auto j = p.toJson();
    EXPECT_EQ(j["benchmark"], "pagination_selected_pages");
    EXPECT_EQ(j["pages"][1]["variant"], "middle");
}

TEST(ResultAggregatorTest, NonPaginatedScenarioHasNoPaginationSummary) {
    auto report = ResultAggregator::aggregate({run("search", 0, ExecutionStatus::SUCCESS, 1.0)});
    EXPECT_TRUE(report.paginationSummaries().empty());
}
