#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>

namespace fileferry::core {

// Immutable view of a transfer at one instant.
struct ProgressSnapshot {
    std::uint64_t current_bytes = 0;
    std::uint64_t total_bytes = 0;      // 0 when the size is unknown
    std::optional<double> percentage;   // unavailable when total_bytes == 0
    double smoothed_speed = 0.0;        // bytes per second
    std::optional<double> eta_seconds;  // unavailable while the speed is still unknown
    double elapsed_seconds = 0.0;

    bool IsComplete() const { return total_bytes > 0 && current_bytes == total_bytes; }
};

inline void to_json(nlohmann::json& j, const ProgressSnapshot& snapshot) {
    j = nlohmann::json{
        {"current_bytes", snapshot.current_bytes},
        {"total_bytes", snapshot.total_bytes},
        {"smoothed_speed", snapshot.smoothed_speed},
        {"elapsed_seconds", snapshot.elapsed_seconds},
    };
    j["percentage"] = snapshot.percentage ? nlohmann::json(*snapshot.percentage) : nullptr;
    j["eta_seconds"] = snapshot.eta_seconds ? nlohmann::json(*snapshot.eta_seconds) : nullptr;
}

} // namespace fileferry::core
