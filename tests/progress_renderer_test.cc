#include <core/notify/progress_renderer.h>
#include <gtest/gtest.h>
#include <limits>
#include <string>

using namespace fileferry::core;

namespace {

std::size_t countGlyph(const std::string& text, std::string_view glyph) {
    std::size_t count = 0;
    for (auto pos = text.find(glyph); pos != std::string::npos; pos = text.find(glyph, pos + 1)) {
        ++count;
    }
    return count;
}

} // namespace

TEST(ProgressRendererTest, BarFillsFloorOfWidthTimesPercentage) {
    auto bar = render::ProgressBar(47.68, 20);
    EXPECT_EQ(countGlyph(bar, "█"), 9u);
    EXPECT_EQ(countGlyph(bar, "░"), 11u);

    EXPECT_EQ(countGlyph(render::ProgressBar(0.0, 20), "█"), 0u);
    EXPECT_EQ(countGlyph(render::ProgressBar(100.0, 20), "█"), 20u);
    EXPECT_EQ(countGlyph(render::ProgressBar(150.0, 10), "█"), 10u);
    EXPECT_EQ(countGlyph(render::ProgressBar(-5.0, 10), "░"), 10u);
}

TEST(ProgressRendererTest, HumanBytesUsesBinaryUnits) {
    EXPECT_EQ(render::HumanBytes(0), "0.00 B");
    EXPECT_EQ(render::HumanBytes(1023), "1023.00 B");
    EXPECT_EQ(render::HumanBytes(1536), "1.50 KB");
    EXPECT_EQ(render::HumanBytes(20.0 * 1024 * 1024), "20.00 MB");
    EXPECT_EQ(render::HumanBytes(3.0 * 1024 * 1024 * 1024 * 1024 * 1024), "3072.00 TB");
}

TEST(ProgressRendererTest, DurationIsHoursMinutesSeconds) {
    EXPECT_EQ(render::Duration(0), "00:00:00");
    EXPECT_EQ(render::Duration(2.74), "00:00:02");
    EXPECT_EQ(render::Duration(3725), "01:02:05");
    EXPECT_EQ(render::Duration(-4), "00:00:00");
}

TEST(ProgressRendererTest, DurationCapsValuesOutOfRange) {
    EXPECT_EQ(render::Duration(1e300), "277777777777:46:40");
    EXPECT_EQ(render::Duration(std::numeric_limits<double>::infinity()), "277777777777:46:40");
    EXPECT_EQ(render::Duration(std::numeric_limits<double>::quiet_NaN()), "00:00:00");
    EXPECT_EQ(render::Duration(-std::numeric_limits<double>::infinity()), "00:00:00");
}

TEST(ProgressRendererTest, StatusTextWithKnownTotal) {
    ProgressSnapshot snapshot{
        .current_bytes = 50 * 1024 * 1024,
        .total_bytes = 100 * 1024 * 1024,
        .percentage = 50.0,
        .smoothed_speed = 10.0 * 1024 * 1024,
        .eta_seconds = 5.0,
        .elapsed_seconds = 5.0,
    };
    auto text = render::StatusText(TransferDirection::kDownload, "movie.mkv", snapshot, 10);

    EXPECT_EQ(text,
              "DOWNLOADING\n"
              "File: movie.mkv\n"
              "Progress: [█████░░░░░] 50.0%\n"
              "Size: 50.00 MB / 100.00 MB\n"
              "Speed: 10.00 MB/s\n"
              "ETA: 00:00:05\n"
              "Elapsed: 00:00:05");
}

TEST(ProgressRendererTest, StatusTextWithUnknownTotalOmitsPercentage) {
    ProgressSnapshot snapshot{.current_bytes = 2048, .elapsed_seconds = 1.0};
    auto text = render::StatusText(TransferDirection::kUpload, "", snapshot);

    EXPECT_EQ(text.rfind("UPLOADING\n", 0), 0u);
    EXPECT_EQ(text.find("File:"), std::string::npos);
    EXPECT_EQ(text.find("Progress:"), std::string::npos);
    EXPECT_NE(text.find("Size: 2.00 KB\n"), std::string::npos);
    EXPECT_NE(text.find("ETA: calculating"), std::string::npos);
}

TEST(ProgressRendererTest, CompletionTextSummarizesTheTransfer) {
    auto text = render::CompletionText(TransferDirection::kUpload,
                                       "report.pdf",
                                       100ULL * 1024 * 1024,
                                       5.0,
                                       20.0 * 1024 * 1024);

    EXPECT_EQ(text,
              "UPLOAD COMPLETE\n"
              "File: report.pdf\n"
              "Size: 100.00 MB\n"
              "Total time: 00:00:05\n"
              "Average speed: 20.00 MB/s");
}
