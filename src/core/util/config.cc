#include <algorithm>
#include <core/constant/path.h>
#include <core/constant/transfer.h>
#include <core/util/config.h>
#include <fstream>
#include <spdlog/spdlog.h>

namespace fileferry::core {

static std::filesystem::path defaultSettingsDir() {
    return path::kDataDir / "users";
}

Settings LoadSettings(const toml::table& table) {
    Settings loaded;

    const auto* transfer_table = table["transfer"].as_table();
    auto transfer_value = [transfer_table](std::string_view key, std::int64_t fallback) {
        if (!transfer_table) {
            return fallback;
        }
        return std::max<std::int64_t>((*transfer_table)[key].value_or(fallback), 0);
    };

    loaded.notify_interval = std::chrono::milliseconds(
        transfer_value("notify-interval-ms", transfer::kNotifyInterval.count()));
    // never below the 0.5 s sampling gate
    loaded.min_sample_interval = std::chrono::milliseconds(
        std::max<std::int64_t>(transfer_value("min-sample-interval-ms",
                                              transfer::kMinSampleInterval.count()),
                               transfer::kMinSampleInterval.count()));
    loaded.speed_window = static_cast<std::size_t>(
        std::max<std::int64_t>(transfer_value("speed-window", transfer::kSpeedWindowSize), 1));
    loaded.progress_bar_width = static_cast<std::size_t>(
        transfer_value("progress-bar-width", transfer::kProgressBarWidth));
    loaded.chunk_size = static_cast<std::uint64_t>(
        std::max<std::int64_t>(transfer_value("chunk-size", transfer::kDefaultChunkSize), 1));
    loaded.max_file_size = static_cast<std::uint64_t>(
        transfer_value("max-file-size", static_cast<std::int64_t>(transfer::kMaxFileSize)));

    const auto* storage = table["storage"].as_table();
    if (storage && storage->contains("settings-dir")) {
        loaded.settings_dir = (*storage)["settings-dir"].value_or(defaultSettingsDir().string());
    } else {
        loaded.settings_dir = defaultSettingsDir();
    }
    std::int64_t capacity = transfer::kRecentRequestCapacity;
    if (storage) {
        capacity = (*storage)["recent-request-capacity"].value_or(capacity);
    }
    loaded.recent_request_capacity = static_cast<std::size_t>(std::max<std::int64_t>(capacity, 1));

    loaded.log_level = table["log"]["level"].value_or(std::string("info"));
    return loaded;
}

void InitConfig() {
    if (!std::filesystem::exists(path::kConfigDir)) {
        spdlog::info("Config directory does not exist, creating...");
        std::filesystem::create_directories(path::kConfigDir);
    }
    auto path = path::kConfigDir / "config.toml";
    if (!std::filesystem::exists(path)) {
        std::ofstream ofs(path);
        spdlog::info("Config file does not exist, creating...");
    }
    try {
        config = toml::parse_file(path.string());
    } catch (const toml::parse_error& err) {
        spdlog::error("\"{}\" could not be opened for parsing: {}",
                      path.string(),
                      err.description());
        config = toml::table{};
    }

    settings = LoadSettings(config);
}

void SaveConfig() {
    auto path = path::kConfigDir / "config.toml";
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        spdlog::error("Failed to open \"{}\" for saving config.", path.string());
        return;
    }
    config.insert_or_assign("transfer",
                            toml::table{
                                {"notify-interval-ms", settings.notify_interval.count()},
                                {"min-sample-interval-ms", settings.min_sample_interval.count()},
                                {"speed-window", static_cast<std::int64_t>(settings.speed_window)},
                                {"progress-bar-width",
                                 static_cast<std::int64_t>(settings.progress_bar_width)},
                                {"chunk-size", static_cast<std::int64_t>(settings.chunk_size)},
                                {"max-file-size",
                                 static_cast<std::int64_t>(settings.max_file_size)},
                            });
    config.insert_or_assign("storage",
                            toml::table{
                                {"settings-dir", settings.settings_dir.string()},
                                {"recent-request-capacity",
                                 static_cast<std::int64_t>(settings.recent_request_capacity)},
                            });
    config.insert_or_assign("log", toml::table{{"level", settings.log_level}});
    ofs << config;
}

} // namespace fileferry::core
