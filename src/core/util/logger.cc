#include <chrono>
#include <core/util/config.h>
#include <core/util/logger.h>
#include <cstdio>
#include <ctime>
#include <spdlog/async.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace fileferry {

static constexpr Logger::Level kDefaultLevel =
#ifdef FILEFERRY_DEBUG
    Logger::Level::debug;
#else
    Logger::Level::info;
#endif

static void stampLogFile(std::FILE* fstream, const char* event, const spdlog::filename_t& name) {
    if (!fstream) {
        return;
    }
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::fprintf(fstream, "[Log %s: %s | %s]\n", event, name.c_str(), std::ctime(&now));
}

Logger::Logger(const std::filesystem::path& log_dir, std::size_t q_max_items)
    : log_file_(log_dir / "fileferry.log") {
    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);

    spdlog::file_event_handlers handlers;
    handlers.after_open = [](const spdlog::filename_t& name, std::FILE* fstream) {
        stampLogFile(fstream, "Start", name);
    };
    handlers.before_close = [](const spdlog::filename_t& name, std::FILE* fstream) {
        stampLogFile(fstream, "End", name);
    };
    auto file_sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(log_file_.string(),
                                                                         0,
                                                                         0,
                                                                         false,
                                                                         0,
                                                                         handlers);
    auto stdout_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
#ifdef FILEFERRY_RELEASE
    stdout_sink->set_level(Level::off);
#endif
    // progress lines go to stdout as well, keep the log prefix short
    stdout_sink->set_pattern("\033[36m[%H:%M:%S.%e] \033[92m[%n] \033[0m%^[%l]%$ %v");

    thread_pool_ = std::make_shared<spdlog::details::thread_pool>(q_max_items, 1);
    logger_ = std::make_shared<spdlog::async_logger>("fileferry",
                                                     spdlog::sinks_init_list{file_sink, stdout_sink},
                                                     thread_pool_);
    logger_->set_level(kDefaultLevel);
    logger_->set_error_handler(
        [](const std::string& msg) { std::fprintf(stderr, "*** LOGGER ERROR ***: %s\n", msg.c_str()); });
    spdlog::set_default_logger(logger_);

    if (ec) {
        spdlog::error("Failed to create log directory \"{}\": {}", log_dir.string(), ec.message());
    }
}

Logger::~Logger() {
    spdlog::shutdown();
}

void Logger::ApplySettings(const std::optional<std::string>& override) {
    auto level = ResolveLevel(core::settings.log_level, override);
    logger_->set_level(level);
    spdlog::debug("Log level set to {}", spdlog::level::to_string_view(level));
}

std::optional<Logger::Level> Logger::ParseLevel(std::string_view name) {
    auto level = spdlog::level::from_str(std::string(name));
    // from_str maps every unknown name to off
    if (level == Level::off && name != "off") {
        return std::nullopt;
    }
    return level;
}

Logger::Level Logger::ResolveLevel(std::string_view configured,
                                   const std::optional<std::string>& override) {
    std::string_view name = override ? std::string_view(*override) : configured;
    if (auto level = ParseLevel(name)) {
        return *level;
    }
    spdlog::warn("Unknown log level \"{}\", using {}",
                 name,
                 spdlog::level::to_string_view(kDefaultLevel));
    return kDefaultLevel;
}

} // namespace fileferry
