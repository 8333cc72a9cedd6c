#pragma once

#include <algorithm>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <core/model/emit_result.h>
#include <core/notify/notification_sink.h>
#include <core/transfer/transfer_error.h>
#include <core/transfer/transfer_transport.h>
#include <filesystem>
#include <functional>
#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fileferry::test {

using Clock = std::chrono::steady_clock;

struct Step {
    std::uint64_t bytes;
    std::chrono::milliseconds delay;
};

// Reports the given byte counts with a delay before each, then optionally fails.
class ScriptedTransport : public core::TransferTransport {
public:
    ScriptedTransport(std::uint64_t total_bytes, std::vector<Step> steps)
        : total_bytes_(total_bytes)
        , steps_(std::move(steps)) {}

    // Evenly spaced steps of `chunk` bytes until total_bytes is reached.
    static std::vector<Step> Even(std::uint64_t total_bytes,
                                  std::uint64_t chunk,
                                  std::chrono::milliseconds delay) {
        std::vector<Step> steps;
        for (std::uint64_t bytes = chunk; bytes < total_bytes; bytes += chunk) {
            steps.push_back({bytes, delay});
        }
        steps.push_back({total_bytes, delay});
        return steps;
    }

    boost::asio::awaitable<void> Run(core::ProgressHandler on_progress) override {
        auto executor = co_await boost::asio::this_coro::executor;
        boost::asio::steady_timer timer(executor);
        for (const auto& step : steps_) {
            timer.expires_after(step.delay);
            co_await timer.async_wait(boost::asio::use_awaitable);
            ++steps_run;
            on_progress(step.bytes, total_bytes_);
            if (after_step) {
                after_step(steps_run);
            }
        }
        if (failure) {
            throw core::TransportError(*failure);
        }
    }

    std::optional<std::string> failure;
    std::function<void(std::size_t)> after_step;
    std::size_t steps_run = 0;

private:
    std::uint64_t total_bytes_;
    std::vector<Step> steps_;
};

// Records every Emit call. `script` picks the result from the 1-based attempt number.
class RecordingSink : public core::NotificationSink {
public:
    struct Attempt {
        Clock::time_point at;
        std::string text;
        bool delivered;
    };

    boost::asio::awaitable<core::EmitResult> Emit(std::string session_id,
                                                  std::string text) override {
        last_session_id = session_id;
        ++in_flight;
        max_in_flight = std::max(max_in_flight, in_flight);
        auto at = Clock::now();

        if (latency.count() > 0) {
            boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor, latency);
            co_await timer.async_wait(boost::asio::use_awaitable);
        }

        core::EmitResult result = script ? script(attempts.size() + 1) : core::emit::Delivered{};
        attempts.push_back({at, text, std::holds_alternative<core::emit::Delivered>(result)});
        --in_flight;
        co_return result;
    }

    std::vector<std::string> delivered() const {
        std::vector<std::string> texts;
        for (const auto& attempt : attempts) {
            if (attempt.delivered) {
                texts.push_back(attempt.text);
            }
        }
        return texts;
    }

    std::function<core::EmitResult(std::size_t)> script;
    std::chrono::milliseconds latency{0};
    std::vector<Attempt> attempts;
    std::string last_session_id;
    int in_flight = 0;
    int max_in_flight = 0;
};

// Fresh directory under the system temp dir, removed with the object.
class TempDir {
public:
    TempDir() {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path_ = std::filesystem::temp_directory_path() / "fileferry_tests"
                / (std::string(info->test_suite_name()) + "_" + info->name());
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace fileferry::test
