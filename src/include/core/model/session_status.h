#pragma once

#include <nlohmann/json.hpp>
#include <string_view>

namespace fileferry::core {

enum class SessionStatus {
    kPending,   // lock acquired, transport not started yet
    kActive,    // bytes are moving
    kThrottled, // notification sink asked us to back off
    kCompleted,
    kFailed,
    kCancelled,
};

NLOHMANN_JSON_SERIALIZE_ENUM(SessionStatus,
                             {
                                 {SessionStatus::kPending, "Pending"},
                                 {SessionStatus::kActive, "Active"},
                                 {SessionStatus::kThrottled, "Throttled"},
                                 {SessionStatus::kCompleted, "Completed"},
                                 {SessionStatus::kFailed, "Failed"},
                                 {SessionStatus::kCancelled, "Cancelled"},
                             })

inline std::string_view SessionStatusToString(SessionStatus status) {
    switch (status) {
    case SessionStatus::kPending:
        return "Pending";
    case SessionStatus::kActive:
        return "Active";
    case SessionStatus::kThrottled:
        return "Throttled";
    case SessionStatus::kCompleted:
        return "Completed";
    case SessionStatus::kFailed:
        return "Failed";
    case SessionStatus::kCancelled:
        return "Cancelled";
    }
    return "Unknown";
}

inline bool IsTerminal(SessionStatus status) {
    return status == SessionStatus::kCompleted || status == SessionStatus::kFailed
           || status == SessionStatus::kCancelled;
}

} // namespace fileferry::core
