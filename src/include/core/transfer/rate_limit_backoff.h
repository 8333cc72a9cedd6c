#pragma once

#include <chrono>
#include <optional>

namespace fileferry::core {

// Remembers until when the notification sink must not be called.
class RateLimitBackoff {
public:
    using Clock = std::chrono::steady_clock;

    // A longer wait replaces a shorter one, never the other way around.
    void OnRateLimited(Clock::time_point now, Clock::duration retry_after);

    bool IsActive(Clock::time_point now) const;

    // Time left until delivery may resume, zero when not backing off.
    Clock::duration Remaining(Clock::time_point now) const;

    void Clear() { backoff_until_.reset(); }

    std::optional<Clock::time_point> backoff_until() const { return backoff_until_; }
    std::size_t times_limited() const { return times_limited_; }

private:
    std::optional<Clock::time_point> backoff_until_;
    std::size_t times_limited_{0};
};

} // namespace fileferry::core
