#pragma once

#include <chrono>
#include <core/constant/transfer.h>
#include <core/model/progress_snapshot.h>
#include <optional>

namespace fileferry::core {

enum class ThrottleDecision {
    kEmit,
    kSuppress,
};

// Decides whether a snapshot goes to the sink now. Delivery itself happens elsewhere.
class NotificationThrottle {
public:
    using Clock = std::chrono::steady_clock;

    explicit NotificationThrottle(Clock::duration min_interval = transfer::kNotifyInterval);

    // The first snapshot and the final one are always emitted. Anything else is emitted
    // only once min_interval has passed since the last emission, otherwise it is kept as
    // the pending snapshot, replacing the previous one.
    ThrottleDecision Offer(const ProgressSnapshot& snapshot, bool is_final, Clock::time_point now);

    void MarkEmitted(Clock::time_point now);

    // Keeps a snapshot as pending without taking a decision.
    void Retain(const ProgressSnapshot& snapshot);

    std::optional<ProgressSnapshot> TakePending();

    const std::optional<ProgressSnapshot>& pending() const { return pending_; }
    std::optional<Clock::time_point> last_emit_time() const { return last_emit_time_; }
    Clock::duration min_interval() const { return min_interval_; }

private:
    Clock::duration min_interval_;
    std::optional<Clock::time_point> last_emit_time_;
    std::optional<ProgressSnapshot> pending_;
};

} // namespace fileferry::core
