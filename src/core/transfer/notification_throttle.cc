#include <core/transfer/notification_throttle.h>
#include <utility>

namespace fileferry::core {

NotificationThrottle::NotificationThrottle(Clock::duration min_interval)
    : min_interval_(min_interval) {}

ThrottleDecision NotificationThrottle::Offer(const ProgressSnapshot& snapshot,
                                             bool is_final,
                                             Clock::time_point now) {
    if (is_final || !last_emit_time_ || now - *last_emit_time_ >= min_interval_) {
        pending_.reset();
        return ThrottleDecision::kEmit;
    }
    pending_ = snapshot;
    return ThrottleDecision::kSuppress;
}

void NotificationThrottle::MarkEmitted(Clock::time_point now) {
    last_emit_time_ = now;
}

void NotificationThrottle::Retain(const ProgressSnapshot& snapshot) {
    pending_ = snapshot;
}

std::optional<ProgressSnapshot> NotificationThrottle::TakePending() {
    return std::exchange(pending_, std::nullopt);
}

} // namespace fileferry::core
