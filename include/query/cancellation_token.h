#pragma once

#include <atomic>
#include <chrono>

namespace rolodex {
namespace query {

/**
 * One-way cancellation flag plus a monotonic deadline for one execution.
 *
 * Owned by the caller, borrowed by QueryExecutor for the duration of one call.
 * cancel() may be invoked from any thread; once set the flag never resets.
 * A token built without a timeout, with a timeout <= 0, or with one too
 * large for the clock has no deadline.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken();
    explicit CancellationToken(std::chrono::milliseconds timeout);

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept;
    bool isCancelled() const noexcept;

    bool hasDeadline() const noexcept { return has_deadline_; }
    Clock::time_point deadline() const noexcept { return deadline_; }

    /// Deadline reached (never true without a deadline)
    bool expired() const noexcept;

    /// Time left until the deadline, zero once expired, max() without a deadline
    std::chrono::milliseconds remaining() const noexcept;

private:
    std::atomic<bool> cancelled_{false};
    bool has_deadline_ = false;
    Clock::time_point deadline_;
};

} // namespace query
} // namespace rolodex
