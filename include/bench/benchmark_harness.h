#pragma once

#include <chrono>
#include <cstdint>
#include <random>
#include <vector>

#include "bench/scenario.h"
#include "query/query_executor.h"

namespace rolodex {
namespace bench {

/**
 * Runs scenarios through a QueryExecutor, one query at a time.
 *
 * Each run gets a fresh copy of the scenario's plan and a fresh
 * CancellationToken with run_deadline. Runs ending in anything other than
 * SUCCESS are recorded and the harness moves on.
 *
 * Pagination scenarios first count the matching rows (under the same
 * deadline), then fetch first = 1, last = page count, middle =
 * max(1, page count / 2) and random = uniform in [1, page count].
 */
class BenchmarkHarness {
public:
    struct Config {
        /// Used for scenarios that do not set their own repetitions
        int repetitions = 1;
        std::chrono::milliseconds run_deadline{30000};  // <= 0: no deadline
        /// Seed for RANDOM page selection
        uint32_t seed = 42;
    };

    explicit BenchmarkHarness(const query::QueryExecutor& executor);
    BenchmarkHarness(const query::QueryExecutor& executor, Config config);

    /// Runs the catalogue in order
    std::vector<BenchmarkResult> run(const std::vector<BenchmarkScenario>& scenarios);

    std::vector<BenchmarkResult> runScenario(const BenchmarkScenario& scenario);

    const Config& config() const { return config_; }

private:
    void runPaginated(const BenchmarkScenario& scenario, int run_index, std::vector<BenchmarkResult>& out);
    BenchmarkResult runOnce(const BenchmarkScenario& scenario, query::QueryPlanPtr plan, int run_index,
                            PageVariant variant, int64_t page);

    static void logResult(const BenchmarkResult& result);

    const query::QueryExecutor& executor_;
    Config config_;
    std::mt19937 rng_;
};

} // namespace bench
} // namespace rolodex
