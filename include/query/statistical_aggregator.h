#pragma once

#include <vector>
#include <nlohmann/json.hpp>

namespace rolodex {
namespace query {

/**
 * @brief Descriptive statistics over run measurements
 *
 * Every function returns null for input it cannot describe (empty, or fewer
 * than two values for the standard deviation) so that reports can tell
 * "no data" apart from zero.
 *
 * Example:
 *   summarize({10, 20, 30, 40, 50})
 *   -> {"count":5, "mean":30, "median":30, "p95":48, "min":10, "max":50, "stddev":15.81...}
 */
class StatisticalAggregator {
public:
    /**
     * @brief p-th percentile with linear interpolation between closest ranks
     * @param values Numeric values (any order)
     * @param percentile 0..100
     * @return Percentile value, null if empty or percentile out of range
     */
    static nlohmann::json calculatePercentile(std::vector<double> values, double percentile);

    /// 50th percentile
    static nlohmann::json calculateMedian(std::vector<double> values);

    static nlohmann::json calculateMean(const std::vector<double>& values);
    static nlohmann::json calculateMin(const std::vector<double>& values);
    static nlohmann::json calculateMax(const std::vector<double>& values);

    /// Sample standard deviation (n - 1)
    static nlohmann::json calculateStdDev(const std::vector<double>& values);

    /// {count, mean, median, p95, min, max, stddev}
    static nlohmann::json summarize(const std::vector<double>& values);
};

} // namespace query
} // namespace rolodex
