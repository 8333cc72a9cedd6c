#include <core/transfer/rate_limit_backoff.h>
#include <spdlog/spdlog.h>

namespace fileferry::core {

void RateLimitBackoff::OnRateLimited(Clock::time_point now, Clock::duration retry_after) {
    if (retry_after < Clock::duration::zero()) {
        retry_after = Clock::duration::zero();
    }
    auto until = now + retry_after;
    if (!backoff_until_ || until > *backoff_until_) {
        backoff_until_ = until;
    }
    ++times_limited_;
    spdlog::debug("Notification backoff for {} ms",
                  std::chrono::duration_cast<std::chrono::milliseconds>(retry_after).count());
}

bool RateLimitBackoff::IsActive(Clock::time_point now) const {
    return backoff_until_ && now < *backoff_until_;
}

RateLimitBackoff::Clock::duration RateLimitBackoff::Remaining(Clock::time_point now) const {
    if (!IsActive(now)) {
        return Clock::duration::zero();
    }
    return *backoff_until_ - now;
}

} // namespace fileferry::core
