#include "query/statistical_aggregator.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace rolodex {
namespace query {

// ============================================================================
// Percentiles
// ============================================================================

nlohmann::json StatisticalAggregator::calculatePercentile(std::vector<double> values, double percentile) {
    if (values.empty() || percentile < 0.0 || percentile > 100.0) {
        return nullptr;
    }

    std::sort(values.begin(), values.end());
    if (values.size() == 1) {
        return values[0];
    }

    // rank = p/100 * (N - 1), interpolated between its neighbours
    double rank = (percentile / 100.0) * static_cast<double>(values.size() - 1);
    size_t lower = static_cast<size_t>(std::floor(rank));
    size_t upper = static_cast<size_t>(std::ceil(rank));
    if (lower == upper) {
        return values[lower];
    }

    double weight = rank - static_cast<double>(lower);
    return values[lower] * (1.0 - weight) + values[upper] * weight;
}

nlohmann::json StatisticalAggregator::calculateMedian(std::vector<double> values) {
    return calculatePercentile(std::move(values), 50.0);
}

// ============================================================================
// Moments and extremes
// ============================================================================

nlohmann::json StatisticalAggregator::calculateMean(const std::vector<double>& values) {
    if (values.empty()) {
        return nullptr;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

nlohmann::json StatisticalAggregator::calculateMin(const std::vector<double>& values) {
    if (values.empty()) {
        return nullptr;
    }
    return *std::min_element(values.begin(), values.end());
}

nlohmann::json StatisticalAggregator::calculateMax(const std::vector<double>& values) {
    if (values.empty()) {
        return nullptr;
    }
    return *std::max_element(values.begin(), values.end());
}

nlohmann::json StatisticalAggregator::calculateStdDev(const std::vector<double>& values) {
    if (values.size() < 2) {
        return nullptr;
    }
    double mean = calculateMean(values).get<double>();
    double sumSquaredDiffs = 0.0;
    for (double v : values) {
        sumSquaredDiffs += (v - mean) * (v - mean);
    }
    return std::sqrt(sumSquaredDiffs / static_cast<double>(values.size() - 1));
}

nlohmann::json StatisticalAggregator::summarize(const std::vector<double>& values) {
    return {
        {"count", values.size()},
        {"mean", calculateMean(values)},
        {"median", calculateMedian(values)},
        {"p95", calculatePercentile(values, 95.0)},
        {"min", calculateMin(values)},
        {"max", calculateMax(values)},
        {"stddev", calculateStdDev(values)}
    };
}

} // namespace query
} // namespace rolodex
