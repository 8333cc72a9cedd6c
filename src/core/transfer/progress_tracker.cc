#include <algorithm>
#include <core/transfer/progress_tracker.h>
#include <numeric>
#include <spdlog/spdlog.h>

namespace fileferry::core {

ProgressTracker::ProgressTracker(std::uint64_t total_bytes,
                                 Clock::time_point start_time,
                                 Clock::duration min_sample_interval,
                                 std::size_t speed_window)
    : total_bytes_(total_bytes)
    , start_time_(start_time)
    , last_sample_time_(start_time)
    , min_sample_interval_(min_sample_interval)
    , speed_window_size_(std::max<std::size_t>(speed_window, 1)) {}

std::uint64_t ProgressTracker::clamp(std::uint64_t current_bytes) const {
    if (total_bytes_ > 0 && current_bytes > total_bytes_) {
        spdlog::debug("Progress sample {} exceeds total {}, clamping", current_bytes, total_bytes_);
        current_bytes = total_bytes_;
    }
    if (current_bytes < current_bytes_) {
        spdlog::debug("Progress sample {} went backwards from {}, ignoring",
                      current_bytes,
                      current_bytes_);
        current_bytes = current_bytes_;
    }
    return current_bytes;
}

std::optional<ProgressSnapshot> ProgressTracker::Update(std::uint64_t current_bytes,
                                                        Clock::time_point now) {
    current_bytes_ = clamp(current_bytes);
    const bool complete = total_bytes_ > 0 && current_bytes_ == total_bytes_;

    const auto elapsed = now - last_sample_time_;
    if (elapsed > Clock::duration::zero() && elapsed >= min_sample_interval_) {
        const double seconds = std::chrono::duration<double>(elapsed).count();
        const double speed = static_cast<double>(current_bytes_ - last_sample_bytes_) / seconds;
        speed_window_.push_back(speed);
        if (speed_window_.size() > speed_window_size_) {
            speed_window_.pop_front();
        }
        last_sample_time_ = now;
        last_sample_bytes_ = current_bytes_;
    } else if (!complete) {
        return std::nullopt;
    }

    if (complete) {
        if (final_reported_) {
            return std::nullopt;
        }
        final_reported_ = true;
    }
    return Latest(now);
}

ProgressSnapshot ProgressTracker::Latest(Clock::time_point now) const {
    ProgressSnapshot snapshot;
    snapshot.current_bytes = current_bytes_;
    snapshot.total_bytes = total_bytes_;
    snapshot.smoothed_speed = smoothed_speed();
    snapshot.elapsed_seconds = std::max(0.0,
                                        std::chrono::duration<double>(now - start_time_).count());

    if (total_bytes_ > 0) {
        snapshot.percentage = 100.0 * static_cast<double>(current_bytes_)
                              / static_cast<double>(total_bytes_);
        const auto remaining = total_bytes_ - current_bytes_;
        if (remaining == 0) {
            snapshot.eta_seconds = 0.0;
        } else if (snapshot.smoothed_speed > 0.0) {
            snapshot.eta_seconds = static_cast<double>(remaining) / snapshot.smoothed_speed;
        }
    }
    return snapshot;
}

double ProgressTracker::smoothed_speed() const {
    if (speed_window_.empty()) {
        return 0.0;
    }
    return std::accumulate(speed_window_.begin(), speed_window_.end(), 0.0)
           / static_cast<double>(speed_window_.size());
}

} // namespace fileferry::core
