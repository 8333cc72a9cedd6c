#include <utility>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <cli/argument_parser.h>
#include <core/model/feedback.h>
#include <core/notify/console_sink.h>
#include <core/notify/progress_renderer.h>
#include <core/storage/user_settings_store.h>
#include <core/storage/user_stats_store.h>
#include <core/transfer/local_copy_transport.h>
#include <core/transfer/transfer_session_manager.h>
#include <core/util/config.h>
#include <core/util/logger.h>
#include <csignal>
#include <iostream>

using namespace fileferry;
using namespace fileferry::core;
namespace net = boost::asio;
namespace fs = std::filesystem;

static int runCopy(const CliOptions& options,
                   const UserSettingsStore& user_settings,
                   UserStatsStore& user_stats) {
    if (options.command_args.size() != 2) {
        std::cerr << "Usage: fileferry copy SRC DST" << std::endl;
        return 1;
    }
    fs::path source = options.command_args[0];
    fs::path destination = options.command_args[1];
    if (!fs::is_regular_file(source)) {
        std::cerr << "Error: " << source.string() << " is not a file" << std::endl;
        return 1;
    }

    net::io_context ioc;
    net::signal_set signals(ioc, SIGINT, SIGTERM);
    UserLockRegistry locks;
    int exit_code = 0;

    auto transfer_options = TransferOptions::FromConfigSettings();
    if (options.notify_interval_ms) {
        transfer_options.notify_interval = std::chrono::milliseconds(*options.notify_interval_ms);
    }

    TransferSessionManager manager(
        ioc,
        locks,
        std::make_shared<ConsoleSink>(std::cout),
        &user_settings,
        &user_stats,
        transfer_options,
        [&](Feedback&& event) {
            spdlog::debug("Feedback: {}", nlohmann::json(event).dump());
            if (event.type == FeedbackType::kUserBusy) {
                exit_code = 1;
            } else if (event.type == FeedbackType::kRequestRejected) {
                std::cerr << "Error: " << event.data["reason"].get<std::string>() << std::endl;
                exit_code = 1;
            } else if (event.type == FeedbackType::kTransferEnded) {
                auto ended = event.data.get<feedback::TransferEnded>();
                if (ended.status == SessionStatus::kCompleted) {
                    std::cout << render::CompletionText(TransferDirection::kDownload,
                                                        destination.filename().string(),
                                                        ended.bytes_transferred,
                                                        ended.elapsed_seconds,
                                                        ended.average_speed)
                              << std::endl;
                } else {
                    std::cerr << "Transfer " << SessionStatusToString(ended.status) << ": "
                              << ended.error_message << std::endl;
                    exit_code = 1;
                }
                signals.cancel();
            }
        },
        settings.recent_request_capacity);

    auto transport = std::make_shared<LocalCopyTransport>(source, destination, settings.chunk_size);
    TransferRequest request{
        .request_id = {},
        .user_id = options.user_id,
        .direction = TransferDirection::kDownload,
        .file_name = source.filename().string(),
        .total_bytes = transport->total_bytes(),
        .artifact_path = transport->artifact_path(),
    };

    auto session_id = manager.StartTransfer(std::move(request), transport);
    if (!session_id) {
        return 1;
    }

    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (!ec) {
            manager.CancelTransfer(*session_id);
        }
    });

    ioc.run();
    return exit_code;
}

static int runStats(const CliOptions& options, const UserStatsStore& user_stats) {
    auto totals = user_stats.GetGlobal();
    if (auto user = user_stats.GetUser(options.user_id)) {
        std::cout << "User: " << options.user_id << "\n"
                  << "Joined: " << user->joined_at << "\n"
                  << "Last active: " << user->last_active << "\n"
                  << "Files: " << user->files_processed << " ("
                  << render::HumanBytes(static_cast<double>(user->bytes_processed)) << ")\n";
    } else {
        std::cout << "User: " << options.user_id << " (no activity yet)\n";
    }
    std::cout << "Total files: " << totals.total_files << " ("
              << render::HumanBytes(static_cast<double>(totals.total_bytes)) << ")\n"
              << "Uptime: " << render::Duration(static_cast<double>(user_stats.uptime().count()))
              << std::endl;
    return 0;
}

// Shows the current value with no argument, stores the argument otherwise.
static int runSetting(const CliOptions& options, UserSettingsStore& user_settings) {
    const auto& command = *options.command;
    const auto& user = options.user_id;
    const bool show = options.command_args.empty();
    const std::string value = show ? std::string() : options.command_args.front();

    bool saved = true;
    if (command == "prefix") {
        if (show) {
            std::cout << user_settings.GetPrefix(user) << std::endl;
        } else {
            saved = user_settings.SetPrefix(user, value);
        }
    } else if (command == "caption") {
        if (show) {
            std::cout << user_settings.GetCaption(user).value_or("(none)") << std::endl;
        } else {
            saved = user_settings.SetCaption(user, value);
        }
    } else if (command == "mode") {
        if (show) {
            std::cout << nlohmann::json(user_settings.GetUploadMode(user)).get<std::string>()
                      << std::endl;
        } else {
            auto mode = nlohmann::json(value).get<UploadMode>();
            if (nlohmann::json(mode).get<std::string>() != value) {
                std::cerr << "Error: Unknown upload mode " << value << std::endl;
                return 1;
            }
            saved = user_settings.SetUploadMode(user, mode);
        }
    } else if (command == "thumbnail") {
        if (show) {
            auto thumbnail = user_settings.GetThumbnail(user);
            std::cout << (thumbnail ? thumbnail->string() : "(none)") << std::endl;
        } else {
            saved = user_settings.SetThumbnail(user, fs::absolute(value));
        }
    } else if (command == "delthumb") {
        if (!user_settings.DeleteThumbnail(user)) {
            std::cout << "No thumbnail to delete" << std::endl;
        }
    } else {
        std::cerr << "Error: Unknown command " << command << std::endl;
        ArgumentParser::ShowHelp();
        return 1;
    }

    if (!saved) {
        std::cerr << "Error: Failed to save " << command << std::endl;
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    CliOptions options;
    try {
        options = ArgumentParser(argc, argv).Parse();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        ArgumentParser::ShowHelp();
        return 1;
    }

    Logger logger;
    InitConfig();
    logger.ApplySettings(options.log_level);

    UserSettingsStore user_settings(settings.settings_dir);
    UserStatsStore user_stats(settings.settings_dir);

    int exit_code = 0;
    if (*options.command == "copy") {
        exit_code = runCopy(options, user_settings, user_stats);
    } else if (*options.command == "stats") {
        exit_code = runStats(options, user_stats);
    } else {
        exit_code = runSetting(options, user_settings);
    }

    SaveConfig();
    return exit_code;
}
