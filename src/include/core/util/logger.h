#pragma once

#include <core/constant/path.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <string>
#include <string_view>

namespace fileferry {

/*
    Process-wide logger, installed as spdlog's default logger.

    Writes to <log_dir>/fileferry_YYYY-MM-DD.log and to stdout (stdout is muted in
    release builds). Starts at debug level in debug builds and info otherwise, until
    ApplySettings() picks the configured level.
*/
class Logger {
public:
    using Level = spdlog::level::level_enum;

    explicit Logger(const std::filesystem::path& log_dir = core::path::kLogDir,
                    std::size_t q_max_items = 8192);
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    ~Logger();

    // The command line level wins over [log] level from the config file.
    void ApplySettings(const std::optional<std::string>& override);

    // "warning" and "warn" are both accepted; std::nullopt for an unknown name.
    static std::optional<Level> ParseLevel(std::string_view name);
    static Level ResolveLevel(std::string_view configured,
                              const std::optional<std::string>& override);

    [[nodiscard]] Level logLevel() const { return logger_->level(); }

private:
    std::filesystem::path log_file_;
    std::shared_ptr<spdlog::details::thread_pool> thread_pool_;
    std::shared_ptr<spdlog::async_logger> logger_;
};

} // namespace fileferry
