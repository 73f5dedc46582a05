#include <gtest/gtest.h>
#include "query/plan_builder.h"
#include "query/query_executor.h"
#include "fake_row_store.h"

#include <atomic>
#include <thread>
#include <vector>

using namespace rolodex;
using namespace rolodex::query;
using rolodex::testing_support::FakeRowStore;
using namespace std::chrono_literals;

class QueryExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<FakeRowStore>();
        auto [st, p] = builder.build(EntityKind::APP_USER, {{"page_size", "10"}});
        ASSERT_TRUE(st.ok());
        plan = p;

        Row row;
        row.id = 7;
        row.values["first_name"] = std::string("John");
        store->canned.rows = {row};
        store->canned.total_count = 1;
        store->canned.statement_count = 2;
    }

    QueryExecutor::Config config(std::chrono::milliseconds poll = 5ms) {
        QueryExecutor::Config c;
        c.poll_interval = poll;
        return c;
    }

    QueryPlanBuilder builder{schema::SchemaRegistry::contacts()};
    std::shared_ptr<FakeRowStore> store;
    QueryPlanPtr plan;
};

TEST_F(QueryExecutorTest, SuccessCarriesRowsAndMetrics) {
    QueryExecutor executor(store, config());
    CancellationToken token(1000ms);

    auto result = executor.execute(plan, token);
    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(result.status, ExecutionStatus::SUCCESS);
    ASSERT_EQ(result.rows.size(), 1u);
    EXPECT_EQ(result.rows[0].id, 7);
    EXPECT_EQ(result.total_count, 1);
    EXPECT_EQ(result.metrics.status, ExecutionStatus::SUCCESS);
    EXPECT_EQ(result.metrics.statement_count, 2u);
    EXPECT_EQ(result.metrics.row_count, 1);
    EXPECT_GE(result.metrics.duration_ms, 0.0);
    EXPECT_EQ(store->execute_calls.load(), 1);
}

TEST_F(QueryExecutorTest, PreCancelledTokenNeverReachesStore) {
    QueryExecutor executor(store, config());
    CancellationToken token(1000ms);
    token.cancel();

    auto result = executor.execute(plan, token);
    EXPECT_EQ(result.status, ExecutionStatus::CANCELLED);
    EXPECT_EQ(result.metrics.statement_count, 0u);
    EXPECT_TRUE(result.rows.empty());

    // Give a wrongly dispatched call time to show up
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(store->execute_calls.load(), 0);
    EXPECT_EQ(store->count_calls.load(), 0);
}

TEST_F(QueryExecutorTest, ExpiredTokenNeverReachesStore) {
    QueryExecutor executor(store, config());
    CancellationToken token(1ms);
    std::this_thread::sleep_for(10ms);

    auto result = executor.count(plan, token);
    EXPECT_EQ(result.status, ExecutionStatus::TIMED_OUT);
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(store->count_calls.load(), 0);
}

TEST_F(QueryExecutorTest, ZeroTimeoutRunsWithoutDeadline) {
    store->delay = 20ms;
    QueryExecutor executor(store, config());
    CancellationToken token(0ms);

    auto result = executor.execute(plan, token);
    EXPECT_EQ(result.status, ExecutionStatus::SUCCESS) << result.error;
    EXPECT_EQ(store->execute_calls.load(), 1);
    // No deadline, so no statement timeout is passed to the store
    EXPECT_EQ(store->last_statement_timeout_ms.load(), 0);
}

TEST_F(QueryExecutorTest, DeadlineReturnsPromptlyAndAbortsStore) {
    store->behaviour = FakeRowStore::Behaviour::BLOCK_UNTIL_ABORT;
    auto cfg = config(5ms);
    cfg.enable_statement_timeout = false;
    QueryExecutor executor(store, cfg);

    const auto deadline = 50ms;
    CancellationToken token(deadline);
    auto started = std::chrono::steady_clock::now();
    auto result = executor.execute(plan, token);
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(result.status, ExecutionStatus::TIMED_OUT);
    EXPECT_GE(elapsed, deadline);
    // Generous slack for loaded CI machines
    EXPECT_LT(elapsed, deadline + 250ms);
    EXPECT_GE(result.metrics.duration_ms, 50.0);

    for (int i = 0; i < 200 && !store->saw_abort.load(); ++i) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_TRUE(store->saw_abort.load());
}

TEST_F(QueryExecutorTest, CancelMidFlightReturnsCancelled) {
    store->behaviour = FakeRowStore::Behaviour::BLOCK_UNTIL_ABORT;
    QueryExecutor executor(store, config(5ms));
    CancellationToken token(10000ms);

    std::thread canceller([&token] {
        std::this_thread::sleep_for(30ms);
        token.cancel();
    });
    auto started = std::chrono::steady_clock::now();
    auto result = executor.execute(plan, token);
    auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    EXPECT_EQ(result.status, ExecutionStatus::CANCELLED);
    EXPECT_LT(elapsed, 1000ms);
    EXPECT_TRUE(result.rows.empty());
}

TEST_F(QueryExecutorTest, ResultArrivingAfterCancelIsDiscarded) {
    // The store finishes successfully, but only after the caller gave up
    store->behaviour = FakeRowStore::Behaviour::SUCCEED;
    store->delay = 80ms;
    QueryExecutor executor(store, config(5ms));
    CancellationToken token(10000ms);

    std::thread canceller([&token] {
        std::this_thread::sleep_for(20ms);
        token.cancel();
    });
    auto result = executor.execute(plan, token);
    canceller.join();

    EXPECT_EQ(result.status, ExecutionStatus::CANCELLED);
    EXPECT_EQ(result.metrics.status, ExecutionStatus::CANCELLED);
    EXPECT_TRUE(result.rows.empty());
    EXPECT_LT(result.metrics.duration_ms, 80.0);

    // Let the store call complete; the returned result must not change
    std::this_thread::sleep_for(120ms);
    EXPECT_EQ(store->execute_calls.load(), 1);
    EXPECT_EQ(result.status, ExecutionStatus::CANCELLED);
    EXPECT_TRUE(result.rows.empty());
}

TEST_F(QueryExecutorTest, StoreStatementTimeoutMapsToTimedOut) {
    store->behaviour = FakeRowStore::Behaviour::HONOUR_STATEMENT_TIMEOUT;
    // Poll slower than the store's own timeout so the store reports first
    auto cfg = config(1000ms);
    QueryExecutor executor(store, cfg);
    CancellationToken token(40ms);

    auto result = executor.execute(plan, token);
    EXPECT_EQ(result.status, ExecutionStatus::TIMED_OUT);
    EXPECT_GT(store->last_statement_timeout_ms.load(), 0);
    EXPECT_LE(store->last_statement_timeout_ms.load(), 40);
}

TEST_F(QueryExecutorTest, StatementTimeoutDisabled) {
    auto cfg = config();
    cfg.enable_statement_timeout = false;
    QueryExecutor executor(store, cfg);
    CancellationToken token(1000ms);

    auto result = executor.execute(plan, token);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(store->last_statement_timeout_ms.load(), 0);
}

TEST_F(QueryExecutorTest, StoreErrorIsExecutionFailed) {
    store->behaviour = FakeRowStore::Behaviour::FAIL;
    QueryExecutor executor(store, config());
    CancellationToken token(1000ms);

    auto result = executor.execute(plan, token);
    EXPECT_EQ(result.status, ExecutionStatus::EXECUTION_FAILED);
    EXPECT_NE(result.error.find("does not exist"), std::string::npos);
}

TEST_F(QueryExecutorTest, StoreExceptionIsExecutionFailed) {
    store->behaviour = FakeRowStore::Behaviour::THROW;
    QueryExecutor executor(store, config());
    CancellationToken token(1000ms);

    auto result = executor.execute(plan, token);
    EXPECT_EQ(result.status, ExecutionStatus::EXECUTION_FAILED);
    EXPECT_NE(result.error.find("connection reset"), std::string::npos);
}

TEST_F(QueryExecutorTest, MissingPlanFails) {
    QueryExecutor executor(store, config());
    CancellationToken token(1000ms);
    auto result = executor.execute(nullptr, token);
    EXPECT_EQ(result.status, ExecutionStatus::EXECUTION_FAILED);
}

TEST_F(QueryExecutorTest, CancellationDisabledWaitsForStore) {
    store->delay = 60ms;
    auto cfg = config();
    cfg.enable_cancellation = false;
    cfg.enable_statement_timeout = false;
    QueryExecutor executor(store, cfg);
    CancellationToken token(10ms);

    auto result = executor.execute(plan, token);
    EXPECT_TRUE(result.ok());
    EXPECT_GE(result.metrics.duration_ms, 60.0);
}

TEST_F(QueryExecutorTest, ConcurrentExecutionsAreIndependent) {
    store->delay = 10ms;
    QueryExecutor executor(store, config());

    constexpr int kThreads = 8;
    std::vector<ExecutionStatus> statuses(kThreads, ExecutionStatus::PENDING);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            CancellationToken token(5000ms);
            // Every other caller gives up immediately
            if (i % 2 == 1) token.cancel();
            statuses[i] = executor.execute(plan, token).status;
        });
    }
    for (auto& t : threads) t.join();

    for (int i = 0; i < kThreads; ++i) {
        EXPECT_EQ(statuses[i], i % 2 == 0 ? ExecutionStatus::SUCCESS : ExecutionStatus::CANCELLED) << i;
    }
    EXPECT_EQ(store->execute_calls.load(), kThreads / 2);
}

TEST(ExecutionStatusTest, Names) {
    EXPECT_STREQ(executionStatusToString(ExecutionStatus::SUCCESS), "success");
    EXPECT_STREQ(executionStatusToString(ExecutionStatus::TIMED_OUT), "timed_out");
    EXPECT_STREQ(executionStatusToString(ExecutionStatus::CANCELLED), "cancelled");
    EXPECT_STREQ(executionStatusToString(ExecutionStatus::EXECUTION_FAILED), "execution_failed");
}
