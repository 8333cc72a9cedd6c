#include <core/constant/transfer.h>
#include <core/util/config.h>
#include <gtest/gtest.h>
#include <string_view>

using namespace fileferry::core;
using namespace std::chrono_literals;
using namespace std::string_view_literals;

TEST(ConfigTest, EmptyTableGivesDefaults) {
    auto loaded = LoadSettings(toml::table{});
    EXPECT_EQ(loaded.notify_interval, transfer::kNotifyInterval);
    EXPECT_EQ(loaded.min_sample_interval, transfer::kMinSampleInterval);
    EXPECT_EQ(loaded.speed_window, transfer::kSpeedWindowSize);
    EXPECT_EQ(loaded.progress_bar_width, transfer::kProgressBarWidth);
    EXPECT_EQ(loaded.chunk_size, transfer::kDefaultChunkSize);
    EXPECT_EQ(loaded.max_file_size, transfer::kMaxFileSize);
    EXPECT_EQ(loaded.recent_request_capacity, transfer::kRecentRequestCapacity);
    EXPECT_EQ(loaded.log_level, "info");
    EXPECT_FALSE(loaded.settings_dir.empty());
}

TEST(ConfigTest, ReadsEverySection) {
    auto table = toml::parse(R"(
        [transfer]
        notify-interval-ms = 3000
        min-sample-interval-ms = 750
        speed-window = 8
        progress-bar-width = 30
        chunk-size = 65536
        max-file-size = 1048576

        [storage]
        settings-dir = "/tmp/fileferry-users"
        recent-request-capacity = 50

        [log]
        level = "debug"
    )"sv);
    auto loaded = LoadSettings(table);

    EXPECT_EQ(loaded.notify_interval, 3000ms);
    EXPECT_EQ(loaded.min_sample_interval, 750ms);
    EXPECT_EQ(loaded.speed_window, 8u);
    EXPECT_EQ(loaded.progress_bar_width, 30u);
    EXPECT_EQ(loaded.chunk_size, 65536u);
    EXPECT_EQ(loaded.max_file_size, 1048576u);
    EXPECT_EQ(loaded.settings_dir.string(), "/tmp/fileferry-users");
    EXPECT_EQ(loaded.recent_request_capacity, 50u);
    EXPECT_EQ(loaded.log_level, "debug");
}

TEST(ConfigTest, NegativeAndZeroValuesAreClamped) {
    auto table = toml::parse(R"(
        [transfer]
        notify-interval-ms = -5
        speed-window = 0
        chunk-size = 0

        [storage]
        recent-request-capacity = -1
    )"sv);
    auto loaded = LoadSettings(table);

    EXPECT_EQ(loaded.notify_interval, 0ms);
    EXPECT_EQ(loaded.speed_window, 1u);
    EXPECT_EQ(loaded.chunk_size, 1u);
    EXPECT_EQ(loaded.recent_request_capacity, 1u);
}

TEST(ConfigTest, SampleIntervalNeverDropsBelowTheDefaultGate) {
    auto table = toml::parse(R"(
        [transfer]
        min-sample-interval-ms = 100
    )"sv);
    EXPECT_EQ(LoadSettings(table).min_sample_interval, 500ms);

    auto negative = toml::parse(R"(
        [transfer]
        min-sample-interval-ms = -20
    )"sv);
    EXPECT_EQ(LoadSettings(negative).min_sample_interval, transfer::kMinSampleInterval);
}

TEST(ConfigTest, ZeroMaxFileSizeDisablesTheLimit) {
    auto table = toml::parse(R"(
        [transfer]
        max-file-size = 0
    )"sv);
    EXPECT_EQ(LoadSettings(table).max_file_size, 0u);
}
