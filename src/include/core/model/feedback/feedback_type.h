#pragma once

#include <nlohmann/json.hpp>

namespace fileferry::core {

enum class FeedbackType {
    kTransferStarted,   // lock acquired, session created (session_id, user_id, file, upload profile)
    kTransferProgress,  // an update reached the sink (session_id, snapshot)
    kTransferThrottled, // notification sink rate limited us (session_id, retry_after_ms)
    kUserBusy,          // rejected: the user already has an active transfer (user_id)
    kDuplicateRequest,  // rejected: request id seen recently (request_id)
    kRequestRejected,   // rejected: invalid file name or file too large (reason)
    kTransferEnded,     // terminal state reached (session_id, status, error_message)
};

NLOHMANN_JSON_SERIALIZE_ENUM(FeedbackType,
                             {
                                 {FeedbackType::kTransferStarted, "TransferStarted"},
                                 {FeedbackType::kTransferProgress, "TransferProgress"},
                                 {FeedbackType::kTransferThrottled, "TransferThrottled"},
                                 {FeedbackType::kUserBusy, "UserBusy"},
                                 {FeedbackType::kDuplicateRequest, "DuplicateRequest"},
                                 {FeedbackType::kRequestRejected, "RequestRejected"},
                                 {FeedbackType::kTransferEnded, "TransferEnded"},
                             });

} // namespace fileferry::core
