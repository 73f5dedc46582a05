#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "query/cancellation_token.h"
#include "query/query_plan.h"
#include "storage/row_store.h"

namespace rolodex {
namespace query {

/// Terminal states of one execution. PENDING is only seen before completion.
enum class ExecutionStatus { PENDING, SUCCESS, CANCELLED, TIMED_OUT, EXECUTION_FAILED };

const char* executionStatusToString(ExecutionStatus status);

/// Measurements of one execution; local to the call that produced them.
struct ExecutionMetrics {
    ExecutionStatus status = ExecutionStatus::PENDING;
    double duration_ms = 0.0;
    uint32_t statement_count = 0;
    int64_t row_count = 0;
    int64_t total_count = -1;   // -1 when no count was requested

    nlohmann::json toJson() const;
};

struct ExecutionResult {
    ExecutionStatus status = ExecutionStatus::PENDING;
    std::vector<Row> rows;
    int64_t total_count = -1;
    ExecutionMetrics metrics;
    std::string error;

    bool ok() const { return status == ExecutionStatus::SUCCESS; }
};

/**
 * Runs plans against a RowStore under a CancellationToken.
 *
 * The store call runs on a detached thread that shares ownership of the store;
 * the caller waits on its future in slices of at most poll_interval, checking
 * the token between slices. On cancellation or deadline the executor returns
 * without waiting for the store and raises the request's abort flag, and a
 * result that arrives afterwards is dropped.
 *
 * The executor holds no per-call state and may be used from many threads.
 */
class QueryExecutor {
public:
    struct Config {
        /// Deadline for tokens created by the service and the harness
        std::chrono::milliseconds query_timeout{30000};  // <= 0: no timeout
        /// Upper bound on how long a cancel or expiry goes unnoticed
        std::chrono::milliseconds poll_interval{5};
        /// false: ignore the token and wait for the store to finish
        bool enable_cancellation = true;
        /// Pass the remaining time to the store as its statement timeout
        bool enable_statement_timeout = true;
    };

    explicit QueryExecutor(std::shared_ptr<RowStore> store);
    QueryExecutor(std::shared_ptr<RowStore> store, Config config);

    /// Paginated select; include_total also runs the count for the page metadata
    ExecutionResult execute(const QueryPlanPtr& plan, CancellationToken& token,
                            bool include_total = true) const;

    /// Count of rows matching the plan's filters and search
    ExecutionResult count(const QueryPlanPtr& plan, CancellationToken& token) const;

    const Config& config() const { return config_; }
    const std::shared_ptr<RowStore>& store() const { return store_; }

private:
    enum class Mode { SELECT, COUNT };

    ExecutionResult run(Mode mode, const QueryPlanPtr& plan, CancellationToken& token,
                        bool include_total) const;

    std::shared_ptr<RowStore> store_;
    Config config_;
};

} // namespace query
} // namespace rolodex
