#pragma once

#include "transfer_coordinator.h"
#include "transfer_options.h"
#include "transfer_request.h"
#include "user_lock_registry.h"
#include <boost/asio/io_context.hpp>
#include <core/model/feedback.h>
#include <core/notify/notification_sink.h>
#include <core/util/recent_id_cache.h>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace fileferry::core {

class UserSettingsStore;
class UserStatsStore;

// Accepts transfer requests and runs one TransferCoordinator per accepted request.
class TransferSessionManager {
public:
    TransferSessionManager(boost::asio::io_context& ioc,
                           UserLockRegistry& locks,
                           std::shared_ptr<NotificationSink> sink,
                           const UserSettingsStore* user_settings = nullptr,
                           UserStatsStore* user_stats = nullptr,
                           TransferOptions options = {},
                           FeedbackCallback callback = nullptr,
                           std::size_t recent_request_capacity = transfer::kRecentRequestCapacity);
    ~TransferSessionManager() = default;
    TransferSessionManager(const TransferSessionManager&) = delete;
    TransferSessionManager& operator=(const TransferSessionManager&) = delete;

    // Returns the new session id, or std::nullopt if the request id was seen recently,
    // the request is not admissible (file name of 1..255 characters, size within
    // options.max_file_size) or the user is busy. Nothing is created in that case.
    std::optional<std::string> StartTransfer(TransferRequest request,
                                             std::shared_ptr<TransferTransport> transport);

    void CancelTransfer(const std::string& session_id);

    std::shared_ptr<TransferCoordinator> FindSession(const std::string& session_id) const;
    std::size_t active_sessions() const { return sessions_.size(); }

private:
    std::optional<std::string> admissionError(const TransferRequest& request) const;
    std::string displayName(const TransferRequest& request) const;
    feedback::TransferStarted describe(const std::string& session_id,
                                       const TransferRequest& request,
                                       const std::string& display_name) const;

    void feedback(Feedback&& feedback) {
        if (callback_) {
            callback_(std::move(feedback));
        }
    }

    boost::asio::io_context& ioc_;
    UserLockRegistry& locks_;
    std::shared_ptr<NotificationSink> sink_;
    const UserSettingsStore* user_settings_;
    UserStatsStore* user_stats_;
    TransferOptions options_;
    FeedbackCallback callback_;
    RecentIdCache recent_requests_;

    std::unordered_map<std::string, std::shared_ptr<TransferCoordinator>> sessions_;
};

} // namespace fileferry::core
