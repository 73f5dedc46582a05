#include "query/query_executor.h"
#include "utils/logger.h"

#include <algorithm>
#include <future>
#include <thread>

namespace rolodex {
namespace query {

const char* executionStatusToString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::PENDING: return "pending";
        case ExecutionStatus::SUCCESS: return "success";
        case ExecutionStatus::CANCELLED: return "cancelled";
        case ExecutionStatus::TIMED_OUT: return "timed_out";
        case ExecutionStatus::EXECUTION_FAILED: return "execution_failed";
    }
    return "pending";
}

nlohmann::json ExecutionMetrics::toJson() const {
    return {
        {"status", executionStatusToString(status)},
        {"duration_ms", duration_ms},
        {"statement_count", statement_count},
        {"row_count", row_count},
        {"total_count", total_count}
    };
}

QueryExecutor::QueryExecutor(std::shared_ptr<RowStore> store)
    : QueryExecutor(std::move(store), Config{}) {}

QueryExecutor::QueryExecutor(std::shared_ptr<RowStore> store, Config config)
    : store_(std::move(store)), config_(config) {
    if (config_.poll_interval.count() <= 0) {
        config_.poll_interval = std::chrono::milliseconds(1);
    }
}

ExecutionResult QueryExecutor::execute(const QueryPlanPtr& plan, CancellationToken& token,
                                       bool include_total) const {
    return run(Mode::SELECT, plan, token, include_total);
}

ExecutionResult QueryExecutor::count(const QueryPlanPtr& plan, CancellationToken& token) const {
    return run(Mode::COUNT, plan, token, true);
}

ExecutionResult QueryExecutor::run(Mode mode, const QueryPlanPtr& plan, CancellationToken& token,
                                   bool include_total) const {
    using Clock = std::chrono::steady_clock;
    using Outcome = std::pair<StoreStatus, StoreResult>;

    const auto started = Clock::now();
    const char* what = mode == Mode::COUNT ? "count" : "query";
    ExecutionResult result;

    auto finish = [&](ExecutionStatus status, std::string error) -> ExecutionResult {
        result.status = status;
        result.error = std::move(error);
        result.metrics.status = status;
        result.metrics.duration_ms =
            std::chrono::duration<double, std::milli>(Clock::now() - started).count();
        result.metrics.row_count = static_cast<int64_t>(result.rows.size());
        result.metrics.total_count = result.total_count;

        switch (status) {
            case ExecutionStatus::SUCCESS:
                ROLODEX_DEBUG("{} finished in {:.2f}ms ({} rows, {} statements)", what,
                              result.metrics.duration_ms, result.metrics.row_count,
                              result.metrics.statement_count);
                break;
            case ExecutionStatus::CANCELLED:
            case ExecutionStatus::TIMED_OUT:
                ROLODEX_WARN("{} {} after {:.2f}ms: {}", what, executionStatusToString(status),
                             result.metrics.duration_ms, result.error);
                break;
            default:
                ROLODEX_ERROR("{} failed after {:.2f}ms: {}", what, result.metrics.duration_ms, result.error);
                break;
        }
        return std::move(result);
    };

    if (!plan) {
        return finish(ExecutionStatus::EXECUTION_FAILED, "no query plan");
    }
    if (!store_) {
        return finish(ExecutionStatus::EXECUTION_FAILED, "no store configured");
    }

    if (config_.enable_cancellation) {
        if (token.isCancelled()) {
            return finish(ExecutionStatus::CANCELLED, "cancelled before dispatch");
        }
        if (token.expired()) {
            return finish(ExecutionStatus::TIMED_OUT, "deadline passed before dispatch");
        }
    }

    auto abort = std::make_shared<std::atomic<bool>>(false);
    StoreRequest request;
    request.plan = plan;
    request.include_total = include_total;
    request.abort_signal = abort;
    if (config_.enable_statement_timeout && token.hasDeadline()) {
        request.statement_timeout = std::max(std::chrono::milliseconds(1), token.remaining());
    }

    auto promise = std::make_shared<std::promise<Outcome>>();
    std::future<Outcome> future = promise->get_future();
    std::shared_ptr<RowStore> store = store_;

    std::thread([store, request, promise, mode]() {
        try {
            promise->set_value(mode == Mode::COUNT ? store->count(request) : store->execute(request));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (config_.enable_cancellation) {
        while (true) {
            if (token.isCancelled()) {
                abort->store(true, std::memory_order_release);
                return finish(ExecutionStatus::CANCELLED, "cancelled while waiting for the store");
            }
            auto remaining = token.remaining();
            if (remaining.count() <= 0) {
                abort->store(true, std::memory_order_release);
                return finish(ExecutionStatus::TIMED_OUT, "deadline exceeded while waiting for the store");
            }
            if (future.wait_for(std::min(config_.poll_interval, remaining)) == std::future_status::ready) {
                break;
            }
        }
        // A result that raced with a cancel is discarded
        if (token.isCancelled()) {
            abort->store(true, std::memory_order_release);
            return finish(ExecutionStatus::CANCELLED, "cancelled while waiting for the store");
        }
    }

    Outcome outcome;
    try {
        outcome = future.get();
    } catch (const std::exception& e) {
        return finish(ExecutionStatus::EXECUTION_FAILED, std::string("store threw: ") + e.what());
    }

    auto& [status, stored] = outcome;
    result.metrics.statement_count = stored.statement_count;
    switch (status.code) {
        case StoreStatus::Code::OK:
            result.rows = std::move(stored.rows);
            result.total_count = stored.total_count;
            return finish(ExecutionStatus::SUCCESS, "");
        case StoreStatus::Code::STATEMENT_TIMEOUT:
            return finish(ExecutionStatus::TIMED_OUT, status.message);
        case StoreStatus::Code::ABORTED:
            return finish(token.isCancelled() ? ExecutionStatus::CANCELLED : ExecutionStatus::TIMED_OUT,
                          status.message);
        case StoreStatus::Code::ERROR:
            break;
    }
    return finish(ExecutionStatus::EXECUTION_FAILED, status.message);
}

} // namespace query
} // namespace rolodex
