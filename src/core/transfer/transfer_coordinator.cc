#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/notify/progress_renderer.h>
#include <core/transfer/transfer_coordinator.h>
#include <core/transfer/transfer_error.h>
#include <exception>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <utility>
#include <variant>

namespace net = boost::asio;
namespace fs = std::filesystem;

namespace fileferry::core {

using Clock = std::chrono::steady_clock;

static net::awaitable<void> waitSignal(net::steady_timer& signal) {
    boost::system::error_code ec;
    co_await signal.async_wait(net::redirect_error(net::use_awaitable, ec));
}

TransferCoordinator::TransferCoordinator(boost::asio::io_context& ioc,
                                         std::string session_id,
                                         TransferRequest request,
                                         UserLockGuard lock,
                                         std::shared_ptr<TransferTransport> transport,
                                         std::shared_ptr<NotificationSink> sink,
                                         TransferOptions options,
                                         SnapshotRenderer renderer,
                                         FeedbackCallback callback)
    : ioc_(ioc)
    , session_id_(std::move(session_id))
    , request_(std::move(request))
    , lock_(std::move(lock))
    , transport_(std::move(transport))
    , sink_(std::move(sink))
    , options_(options)
    , renderer_(std::move(renderer))
    , callback_(std::move(callback))
    , tracker_(request_.total_bytes,
               Clock::now(),
               options_.min_sample_interval,
               options_.speed_window)
    , throttle_(options_.notify_interval)
    , wake_signal_(ioc, Clock::time_point::max())
    , delivery_done_signal_(ioc, Clock::time_point::max())
    , backoff_timer_(ioc) {
    if (!renderer_) {
        renderer_ = [direction = request_.direction,
                     name = request_.file_name,
                     width = options_.progress_bar_width](const ProgressSnapshot& snapshot) {
            return render::StatusText(direction, name, snapshot, width);
        };
    }
}

void TransferCoordinator::Cancel() {
    spdlog::info("Try to cancel transfer session: {}", session_id_);
    cancel_requested_ = true;
}

net::awaitable<void> TransferCoordinator::Run() {
    auto self = shared_from_this();
    // Lives in the coroutine frame: released on every way out of Run().
    auto lock = std::move(lock_);

    if (!lock.owns_lock()) {
        spdlog::error("Session {} started without holding the lock of user {}",
                      session_id_,
                      request_.user_id);
        error_message_ = "user lock not held";
        finish(SessionStatus::kFailed, lock);
        co_return;
    }

    session_status_ = SessionStatus::kActive;
    spdlog::info("Transfer session {} started for user {}: {} ({} bytes)",
                 session_id_,
                 request_.user_id,
                 request_.file_name,
                 request_.total_bytes);

    delivery_running_ = true;
    net::co_spawn(ioc_, deliveryLoop(), [self](std::exception_ptr p) {
        if (p) {
            try {
                std::rethrow_exception(p);
            } catch (const std::exception& e) {
                spdlog::error("Delivery of session {} stopped: {}", self->session_id_, e.what());
            }
        }
        self->delivery_running_ = false;
        self->delivery_done_signal_.cancel();
    });

    SessionStatus outcome = SessionStatus::kCompleted;
    try {
        if (cancel_requested_) {
            throw TransferCancelled();
        }

        co_await transport_->Run([this](std::uint64_t current_bytes, std::uint64_t total_bytes) {
            onSample(current_bytes, total_bytes);
        });

        if (request_.total_bytes > 0 && tracker_.current_bytes() < request_.total_bytes) {
            spdlog::warn("Transport of session {} finished at {} of {} bytes",
                         session_id_,
                         tracker_.current_bytes(),
                         request_.total_bytes);
        }
        if (!final_scheduled_) {
            schedule(tracker_.Latest(Clock::now()), true);
        }
        closing_ = true;
        wake();
    } catch (const TransferCancelled& e) {
        outcome = SessionStatus::kCancelled;
        error_message_ = e.what();
    } catch (const std::exception& e) {
        outcome = SessionStatus::kFailed;
        error_message_ = e.what();
    }

    if (outcome != SessionStatus::kCompleted) {
        abandoned_ = true;
        closing_ = true;
        backoff_timer_.cancel();
        wake();
    }

    // in-flight sink calls finish before teardown
    while (delivery_running_) {
        co_await waitSignal(delivery_done_signal_);
    }

    finish(outcome, lock);
}

void TransferCoordinator::onSample(std::uint64_t current_bytes, std::uint64_t total_bytes) {
    if (cancel_requested_) {
        spdlog::info("Session {} cancelled at {}/{} bytes", session_id_, current_bytes, total_bytes);
        throw TransferCancelled();
    }

    auto snapshot = tracker_.Update(current_bytes, Clock::now());
    if (!snapshot) {
        return;
    }
    schedule(*snapshot, snapshot->IsComplete());
}

void TransferCoordinator::schedule(const ProgressSnapshot& snapshot, bool is_final) {
    if (is_final) {
        final_scheduled_ = true;
    }

    // The sink is busy or must not be called yet: keep only the freshest snapshot.
    if (delivering_ || outbox_ || session_status_ == SessionStatus::kThrottled) {
        throttle_.Retain(snapshot);
        pending_final_ = pending_final_ || is_final;
        return;
    }

    if (throttle_.Offer(snapshot, is_final, Clock::now()) == ThrottleDecision::kEmit) {
        outbox_ = snapshot;
        wake();
    }
}

net::awaitable<void> TransferCoordinator::deliveryLoop() {
    auto self = shared_from_this();
    for (;;) {
        if (abandoned_) {
            co_return;
        }
        if (!outbox_ && pending_final_) {
            pending_final_ = false;
            outbox_ = throttle_.TakePending();
        }
        if (!outbox_) {
            if (closing_) {
                co_return;
            }
            co_await waitSignal(wake_signal_);
            continue;
        }

        auto snapshot = *std::exchange(outbox_, std::nullopt);
        co_await deliver(std::move(snapshot));
    }
}

net::awaitable<void> TransferCoordinator::deliver(ProgressSnapshot snapshot) {
    for (;;) {
        EmitResult result;
        delivering_ = true;
        try {
            result = co_await sink_->Emit(session_id_, renderer_(snapshot));
        } catch (const std::exception& e) {
            result = emit::PermanentError{e.what()};
        }
        delivering_ = false;
        const auto now = Clock::now();

        if (std::holds_alternative<emit::Delivered>(result)) {
            throttle_.MarkEmitted(now);
            ++notifications_delivered_;
            last_delivered_ = snapshot;
            nlohmann::json data = feedback::TransferProgress{session_id_, snapshot};
            feedback(Feedback{.type = FeedbackType::kTransferProgress, .data = std::move(data)});
            co_return;
        }

        if (const auto* error = std::get_if<emit::PermanentError>(&result)) {
            // Progress reporting is best effort, the transfer goes on.
            spdlog::warn("Progress update of session {} rejected: {}", session_id_, error->message);
            throttle_.MarkEmitted(now);
            co_return;
        }

        const auto retry_after = std::get<emit::RateLimited>(result).retry_after;
        backoff_.OnRateLimited(now, retry_after);
        session_status_ = SessionStatus::kThrottled;
        spdlog::info("Session {} rate limited, pausing updates for {} ms",
                     session_id_,
                     retry_after.count());
        nlohmann::json data = feedback::TransferThrottled{session_id_, retry_after.count()};
        feedback(Feedback{.type = FeedbackType::kTransferThrottled, .data = std::move(data)});

        if (!throttle_.pending()) {
            throttle_.Retain(snapshot);
        }

        co_await waitForBackoff();
        backoff_.Clear();
        session_status_ = SessionStatus::kActive;
        if (abandoned_) {
            co_return;
        }

        // The wait already spaced this update from the previous one.
        auto pending = throttle_.TakePending();
        pending_final_ = false;
        if (!pending) {
            co_return;
        }
        snapshot = *pending;
    }
}

net::awaitable<void> TransferCoordinator::waitForBackoff() {
    auto until = backoff_.backoff_until();
    if (!until || abandoned_) {
        co_return;
    }
    backoff_timer_.expires_at(*until);
    boost::system::error_code ec;
    co_await backoff_timer_.async_wait(net::redirect_error(net::use_awaitable, ec));
    if (ec && ec != net::error::operation_aborted) {
        spdlog::warn("Backoff timer of session {} failed: {}", session_id_, ec.message());
    }
}

void TransferCoordinator::wake() {
    wake_signal_.cancel();
}

void TransferCoordinator::finish(SessionStatus status, UserLockGuard& lock) {
    session_status_ = status;
    if (status != SessionStatus::kCompleted) {
        removeArtifact();
    }
    lock.Release();

    const auto bytes = tracker_.current_bytes();
    const double elapsed = tracker_.Latest(Clock::now()).elapsed_seconds;
    const double average_speed = elapsed > 0.0 ? static_cast<double>(bytes) / elapsed : 0.0;

    switch (status) {
    case SessionStatus::kCompleted:
        spdlog::info("Transfer session {} completed, {} bytes in {:.2f} s, {} updates delivered",
                     session_id_,
                     bytes,
                     elapsed,
                     notifications_delivered_);
        break;
    case SessionStatus::kCancelled:
        spdlog::info("Transfer session {} cancelled", session_id_);
        break;
    default:
        spdlog::error("Transfer session {} failed: {}", session_id_, error_message_);
        break;
    }

    nlohmann::json data = feedback::TransferEnded{
        .session_id = session_id_,
        .user_id = request_.user_id,
        .status = status,
        .bytes_transferred = bytes,
        .notifications_delivered = notifications_delivered_,
        .elapsed_seconds = elapsed,
        .average_speed = average_speed,
        .error_message = error_message_,
    };
    feedback(Feedback{.type = FeedbackType::kTransferEnded, .data = std::move(data)});
}

void TransferCoordinator::removeArtifact() {
    if (request_.artifact_path.empty()) {
        return;
    }
    std::error_code ec;
    if (fs::remove(request_.artifact_path, ec)) {
        spdlog::info("Removed partial file {}", request_.artifact_path.string());
    } else if (ec) {
        spdlog::error("Failed to remove partial file {}: {}",
                      request_.artifact_path.string(),
                      ec.message());
    }
}

} // namespace fileferry::core
