#pragma once

#include <core/model/session_status.h>
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace fileferry::core::feedback {

struct TransferEnded {
    std::string session_id;
    std::string user_id;
    SessionStatus status;
    std::uint64_t bytes_transferred = 0;
    std::size_t notifications_delivered = 0;
    double elapsed_seconds = 0.0; // session lifetime up to the terminal state
    double average_speed = 0.0;   // bytes_transferred / elapsed_seconds
    std::string error_message;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(TransferEnded,
                                   session_id,
                                   user_id,
                                   status,
                                   bytes_transferred,
                                   notifications_delivered,
                                   elapsed_seconds,
                                   average_speed,
                                   error_message);
};

} // namespace fileferry::core::feedback
