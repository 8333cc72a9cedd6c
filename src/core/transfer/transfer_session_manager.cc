#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <core/notify/progress_renderer.h>
#include <core/storage/user_settings_store.h>
#include <core/storage/user_stats_store.h>
#include <core/transfer/transfer_session_manager.h>
#include <exception>
#include <format>
#include <spdlog/spdlog.h>

namespace net = boost::asio;

namespace fileferry::core {

TransferSessionManager::TransferSessionManager(boost::asio::io_context& ioc,
                                               UserLockRegistry& locks,
                                               std::shared_ptr<NotificationSink> sink,
                                               const UserSettingsStore* user_settings,
                                               UserStatsStore* user_stats,
                                               TransferOptions options,
                                               FeedbackCallback callback,
                                               std::size_t recent_request_capacity)
    : ioc_(ioc)
    , locks_(locks)
    , sink_(std::move(sink))
    , user_settings_(user_settings)
    , user_stats_(user_stats)
    , options_(options)
    , callback_(std::move(callback))
    , recent_requests_(recent_request_capacity) {}

std::optional<std::string> TransferSessionManager::StartTransfer(
    TransferRequest request, std::shared_ptr<TransferTransport> transport) {
    if (!request.request_id.empty() && !recent_requests_.Insert(request.request_id)) {
        spdlog::info("Request {} of user {} already seen, ignoring",
                     request.request_id,
                     request.user_id);
        nlohmann::json data = feedback::DuplicateRequest{request.user_id, request.request_id};
        feedback(Feedback{.type = FeedbackType::kDuplicateRequest, .data = std::move(data)});
        return std::nullopt;
    }

    if (user_stats_) {
        user_stats_->TouchUser(request.user_id);
    }

    if (auto reason = admissionError(request)) {
        spdlog::info("Request {} of user {} rejected: {}",
                     request.request_id,
                     request.user_id,
                     *reason);
        nlohmann::json data = feedback::RequestRejected{request.user_id,
                                                        request.request_id,
                                                        std::move(*reason)};
        feedback(Feedback{.type = FeedbackType::kRequestRejected, .data = std::move(data)});
        return std::nullopt;
    }

    auto lock = locks_.TryLock(request.user_id);
    if (!lock) {
        spdlog::info("User {} already has an active transfer, rejecting {}",
                     request.user_id,
                     request.file_name);
        nlohmann::json data = feedback::UserBusy{request.user_id, request.request_id};
        feedback(Feedback{.type = FeedbackType::kUserBusy, .data = std::move(data)});
        return std::nullopt;
    }

    boost::uuids::random_generator uuid_gen;
    std::string session_id = boost::uuids::to_string(uuid_gen());
    std::string display_name = displayName(request);

    nlohmann::json data = describe(session_id, request, display_name);
    feedback(Feedback{.type = FeedbackType::kTransferStarted, .data = std::move(data)});

    auto direction = request.direction;
    auto width = options_.progress_bar_width;
    auto coordinator = std::make_shared<TransferCoordinator>(
        ioc_,
        session_id,
        std::move(request),
        std::move(*lock),
        std::move(transport),
        sink_,
        options_,
        [direction, display_name, width](const ProgressSnapshot& snapshot) {
            return render::StatusText(direction, display_name, snapshot, width);
        },
        callback_);
    sessions_[session_id] = coordinator;

    net::co_spawn(ioc_, coordinator->Run(), [this, coordinator](std::exception_ptr p) {
        const auto& id = coordinator->session_id();
        if (p) {
            try {
                std::rethrow_exception(p);
            } catch (const std::exception& e) {
                spdlog::error("TransferSession {} aborted: {}", id, e.what());
            }
        }
        if (!coordinator->IsTerminal()) {
            spdlog::warn("TransferSession {} not finished, clean up anyway", id);
        } else {
            spdlog::debug("TransferSession {} cleaned up", id);
        }
        if (user_stats_ && coordinator->session_status() == SessionStatus::kCompleted
            && !user_stats_->RecordCompleted(coordinator->request().user_id,
                                             coordinator->bytes_transferred())) {
            spdlog::error("Failed to record stats of session {}", id);
        }
        sessions_.erase(id);
    });
    return session_id;
}

void TransferSessionManager::CancelTransfer(const std::string& session_id) {
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        spdlog::warn("No transfer session {} to cancel", session_id);
        return;
    }
    it->second->Cancel();
}

std::shared_ptr<TransferCoordinator> TransferSessionManager::FindSession(
    const std::string& session_id) const {
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::optional<std::string> TransferSessionManager::admissionError(
    const TransferRequest& request) const {
    if (request.file_name.empty()) {
        return "empty file name";
    }
    if (request.file_name.size() > transfer::kMaxFileNameLength) {
        return std::format("file name longer than {} characters", transfer::kMaxFileNameLength);
    }
    if (options_.max_file_size > 0 && request.total_bytes > options_.max_file_size) {
        return std::format("{} exceeds the {} limit",
                           render::HumanBytes(static_cast<double>(request.total_bytes)),
                           render::HumanBytes(static_cast<double>(options_.max_file_size)));
    }
    return std::nullopt;
}

std::string TransferSessionManager::displayName(const TransferRequest& request) const {
    if (!user_settings_) {
        return request.file_name;
    }
    return user_settings_->GetPrefix(request.user_id) + request.file_name;
}

feedback::TransferStarted TransferSessionManager::describe(const std::string& session_id,
                                                           const TransferRequest& request,
                                                           const std::string& display_name) const {
    feedback::TransferStarted started{
        .session_id = session_id,
        .user_id = request.user_id,
        .direction = request.direction,
        .display_name = display_name,
        .total_bytes = request.total_bytes,
        .upload_as = GetMediaKind(display_name),
        .caption = display_name,
        .has_thumbnail = false,
    };
    if (user_settings_) {
        started.upload_as = ResolveUploadMode(user_settings_->GetUploadMode(request.user_id),
                                              display_name);
        started.caption = user_settings_->GetCaption(request.user_id).value_or(display_name);
        started.has_thumbnail = SupportsThumbnail(started.upload_as)
                                && user_settings_->GetThumbnail(request.user_id).has_value();
    }
    return started;
}

} // namespace fileferry::core
