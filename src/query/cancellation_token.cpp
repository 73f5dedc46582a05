#include "query/cancellation_token.h"

namespace rolodex {
namespace query {

CancellationToken::CancellationToken()
    : deadline_(Clock::time_point::max()) {}

CancellationToken::CancellationToken(std::chrono::milliseconds timeout)
    : deadline_(Clock::time_point::max()) {
    // Non-positive: no timeout. Beyond the clock's range: no deadline either.
    if (timeout.count() <= 0) {
        return;
    }
    const auto now = Clock::now();
    if (timeout >= std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now)) {
        return;
    }
    has_deadline_ = true;
    deadline_ = now + timeout;
}

void CancellationToken::cancel() noexcept {
    cancelled_.store(true, std::memory_order_release);
}

bool CancellationToken::isCancelled() const noexcept {
    return cancelled_.load(std::memory_order_acquire);
}

bool CancellationToken::expired() const noexcept {
    return has_deadline_ && Clock::now() >= deadline_;
}

std::chrono::milliseconds CancellationToken::remaining() const noexcept {
    if (!has_deadline_) {
        return std::chrono::milliseconds::max();
    }
    auto now = Clock::now();
    if (now >= deadline_) {
        return std::chrono::milliseconds::zero();
    }
    // Round up so a positive remainder never reads as zero
    return std::chrono::ceil<std::chrono::milliseconds>(deadline_ - now);
}

} // namespace query
} // namespace rolodex
