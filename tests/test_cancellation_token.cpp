#include <gtest/gtest.h>
#include "query/cancellation_token.h"

#include <thread>

using namespace rolodex::query;
using namespace std::chrono_literals;

TEST(CancellationTokenTest, StartsActive) {
    CancellationToken token(1000ms);
    EXPECT_FALSE(token.isCancelled());
    EXPECT_FALSE(token.expired());
    EXPECT_TRUE(token.hasDeadline());
    EXPECT_GT(token.remaining().count(), 0);
    EXPECT_LE(token.remaining().count(), 1000);
}

TEST(CancellationTokenTest, CancelIsOneWayAndIdempotent) {
    CancellationToken token;
    token.cancel();
    EXPECT_TRUE(token.isCancelled());
    token.cancel();
    EXPECT_TRUE(token.isCancelled());
}

TEST(CancellationTokenTest, ExpiresAfterTimeout) {
    CancellationToken token(20ms);
    std::this_thread::sleep_for(40ms);
    EXPECT_TRUE(token.expired());
    EXPECT_EQ(token.remaining().count(), 0);
    // Expiry does not set the cancel flag
    EXPECT_FALSE(token.isCancelled());
}

TEST(CancellationTokenTest, NoDeadlineNeverExpires) {
    CancellationToken token;
    EXPECT_FALSE(token.hasDeadline());
    EXPECT_FALSE(token.expired());
    EXPECT_EQ(token.remaining(), std::chrono::milliseconds::max());
}

TEST(CancellationTokenTest, CancelFromAnotherThread) {
    CancellationToken token(5000ms);
    std::thread t([&token] { token.cancel(); });
    t.join();
    EXPECT_TRUE(token.isCancelled());
}

TEST(CancellationTokenTest, NonPositiveTimeoutMeansNoDeadline) {
    CancellationToken zero(0ms);
    EXPECT_FALSE(zero.hasDeadline());
    EXPECT_FALSE(zero.expired());
    EXPECT_EQ(zero.remaining(), std::chrono::milliseconds::max());

    CancellationToken negative(-5ms);
    EXPECT_FALSE(negative.hasDeadline());
    EXPECT_FALSE(negative.expired());
}

TEST(CancellationTokenTest, HugeTimeoutSaturatesToNoDeadline) {
    CancellationToken huge(std::chrono::milliseconds(9223372036854775LL));
    EXPECT_FALSE(huge.hasDeadline());
    EXPECT_FALSE(huge.expired());
    EXPECT_EQ(huge.remaining(), std::chrono::milliseconds::max());

    CancellationToken maxed(std::chrono::milliseconds::max());
    EXPECT_FALSE(maxed.hasDeadline());
    EXPECT_FALSE(maxed.expired());
}

TEST(CancellationTokenTest, LongTimeoutStaysInTheFuture) {
    // One year
    CancellationToken token(std::chrono::hours(24 * 365));
    EXPECT_TRUE(token.hasDeadline());
    EXPECT_FALSE(token.expired());
    EXPECT_GT(token.remaining(), std::chrono::hours(24 * 364));
}

TEST(CancellationTokenTest, ShortTimeoutExpires) {
    CancellationToken token(1ms);
    std::this_thread::sleep_for(10ms);
    EXPECT_TRUE(token.expired());
    EXPECT_EQ(token.remaining().count(), 0);
}
