/*
    config.h
    Application configuration backed by a TOML file.

    Example usage:

    General configuration:
    - Read a value from the general config:
        T value = fileferry::core::config["key"].value_or(default_value);

    Typed settings:
        auto interval = fileferry::core::settings.notify_interval;
        auto width = fileferry::core::settings.progress_bar_width;

    Initialization and saving:
    - Initialize the configuration (loads from file or creates default):
        fileferry::core::InitConfig();
    - Save the current configuration to file:
        fileferry::core::SaveConfig();
*/

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <toml++/toml.h>

namespace fileferry::core {

inline toml::table config;

struct Settings {
    std::chrono::milliseconds notify_interval;     // minimum gap between two progress updates
    std::chrono::milliseconds min_sample_interval; // speed samples closer than this are ignored
    std::size_t speed_window;                      // number of speed samples averaged
    std::size_t progress_bar_width;
    std::uint64_t chunk_size;
    std::uint64_t max_file_size;                   // larger requests are rejected, 0 disables
    std::filesystem::path settings_dir;            // per-user json stores
    std::size_t recent_request_capacity;
    std::string log_level;
};

inline Settings settings;

// Fills a Settings from a parsed table, falling back to defaults for missing keys.
Settings LoadSettings(const toml::table& table);

void InitConfig();

void SaveConfig();

} // namespace fileferry::core
