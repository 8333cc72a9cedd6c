#pragma once

#include "notification_throttle.h"
#include "progress_tracker.h"
#include "rate_limit_backoff.h"
#include "transfer_options.h"
#include "transfer_request.h"
#include "transfer_transport.h"
#include "user_lock_registry.h"
#include <atomic>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <core/model/feedback.h>
#include <core/model/session_status.h>
#include <core/notify/notification_sink.h>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace fileferry::core {

using SnapshotRenderer = std::function<std::string(const ProgressSnapshot&)>;

/*
    Drives one transfer from lock acquisition to a terminal state.

    Run() owns the user lock for its whole lifetime and starts the transport. Progress
    samples arrive through the transport's handler and feed the tracker; snapshots the
    throttle lets through are handed to a separate delivery coroutine so a slow sink
    never holds up the transport. While the sink is busy or backing off, newer snapshots
    replace the pending one.

    All members are touched from the io_context thread only, except Cancel().
*/
class TransferCoordinator : public std::enable_shared_from_this<TransferCoordinator> {
public:
    TransferCoordinator(boost::asio::io_context& ioc,
                        std::string session_id,
                        TransferRequest request,
                        UserLockGuard lock,
                        std::shared_ptr<TransferTransport> transport,
                        std::shared_ptr<NotificationSink> sink,
                        TransferOptions options = {},
                        SnapshotRenderer renderer = nullptr,
                        FeedbackCallback callback = nullptr);
    ~TransferCoordinator() = default;
    TransferCoordinator(const TransferCoordinator&) = delete;
    TransferCoordinator& operator=(const TransferCoordinator&) = delete;

    boost::asio::awaitable<void> Run();

    // Observed at the next progress sample.
    void Cancel();

    const std::string& session_id() const { return session_id_; }
    const TransferRequest& request() const { return request_; }
    SessionStatus session_status() const { return session_status_; }
    bool IsTerminal() const { return core::IsTerminal(session_status_); }
    const std::string& error_message() const { return error_message_; }

    std::uint64_t bytes_transferred() const { return tracker_.current_bytes(); }
    std::size_t notifications_delivered() const { return notifications_delivered_; }
    const std::optional<ProgressSnapshot>& last_delivered() const { return last_delivered_; }

private:
    void onSample(std::uint64_t current_bytes, std::uint64_t total_bytes);
    void schedule(const ProgressSnapshot& snapshot, bool is_final);

    boost::asio::awaitable<void> deliveryLoop();
    boost::asio::awaitable<void> deliver(ProgressSnapshot snapshot);
    boost::asio::awaitable<void> waitForBackoff();

    void wake();
    void finish(SessionStatus status, UserLockGuard& lock);
    void removeArtifact();

    void feedback(Feedback&& feedback) {
        if (callback_) {
            callback_(std::move(feedback));
        }
    }

    boost::asio::io_context& ioc_;
    std::string session_id_;
    TransferRequest request_;
    UserLockGuard lock_;
    std::shared_ptr<TransferTransport> transport_;
    std::shared_ptr<NotificationSink> sink_;
    TransferOptions options_;
    SnapshotRenderer renderer_;
    FeedbackCallback callback_;

    ProgressTracker tracker_;
    NotificationThrottle throttle_;
    RateLimitBackoff backoff_;

    SessionStatus session_status_{SessionStatus::kPending};
    std::string error_message_;
    std::atomic<bool> cancel_requested_{false};

    // handed from the sample path to the delivery coroutine
    std::optional<ProgressSnapshot> outbox_;
    bool pending_final_{false};
    bool final_scheduled_{false};
    bool delivering_{false};
    bool closing_{false};   // no more samples, flush and stop
    bool abandoned_{false}; // failed or cancelled, stop without flushing
    bool delivery_running_{false};

    // parked at time_point::max(), cancelled to signal
    boost::asio::steady_timer wake_signal_;
    boost::asio::steady_timer delivery_done_signal_;
    boost::asio::steady_timer backoff_timer_;

    std::size_t notifications_delivered_{0};
    std::optional<ProgressSnapshot> last_delivered_;
};

} // namespace fileferry::core
