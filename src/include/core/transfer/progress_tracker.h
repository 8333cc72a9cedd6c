#pragma once

#include <chrono>
#include <core/constant/transfer.h>
#include <core/model/progress_snapshot.h>
#include <cstdint>
#include <deque>
#include <optional>

namespace fileferry::core {

/*
    Turns raw byte counters into percentage, smoothed speed and ETA.

    Samples closer than min_sample_interval to the previous accepted sample only move
    the byte counter: they push no speed reading and produce no snapshot, except for the
    first sample that reaches total_bytes, which always yields one.
    Counters going backwards or past total_bytes are clamped.
*/
class ProgressTracker {
public:
    using Clock = std::chrono::steady_clock;

    ProgressTracker(std::uint64_t total_bytes,
                    Clock::time_point start_time,
                    Clock::duration min_sample_interval = transfer::kMinSampleInterval,
                    std::size_t speed_window = transfer::kSpeedWindowSize);

    std::optional<ProgressSnapshot> Update(std::uint64_t current_bytes, Clock::time_point now);

    // Snapshot of the current state; never pushes a speed sample.
    ProgressSnapshot Latest(Clock::time_point now) const;

    std::uint64_t total_bytes() const { return total_bytes_; }
    std::uint64_t current_bytes() const { return current_bytes_; }
    double smoothed_speed() const;
    const std::deque<double>& speed_window() const { return speed_window_; }

private:
    std::uint64_t clamp(std::uint64_t current_bytes) const;

    std::uint64_t total_bytes_;
    std::uint64_t current_bytes_{0};
    Clock::time_point start_time_;
    Clock::time_point last_sample_time_;
    std::uint64_t last_sample_bytes_{0};
    Clock::duration min_sample_interval_;
    std::size_t speed_window_size_;
    std::deque<double> speed_window_;
    bool final_reported_{false};
};

} // namespace fileferry::core
