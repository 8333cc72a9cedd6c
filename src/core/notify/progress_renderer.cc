#include <algorithm>
#include <array>
#include <cmath>
#include <core/notify/progress_renderer.h>
#include <format>

namespace fileferry::core::render {

static constexpr std::string_view kFullGlyph = "█";
static constexpr std::string_view kEmptyGlyph = "░";
static constexpr double kMaxDurationSeconds = 1e15;

std::string ProgressBar(double percentage, std::size_t width) {
    percentage = std::clamp(percentage, 0.0, 100.0);
    auto filled = static_cast<std::size_t>(
        std::floor(static_cast<double>(width) * percentage / 100.0));
    filled = std::min(filled, width);

    std::string bar;
    bar.reserve(width * kFullGlyph.size());
    for (std::size_t i = 0; i < filled; ++i) {
        bar += kFullGlyph;
    }
    for (std::size_t i = filled; i < width; ++i) {
        bar += kEmptyGlyph;
    }
    return bar;
}

std::string HumanBytes(double bytes) {
    static constexpr std::array<std::string_view, 5> kUnits{"B", "KB", "MB", "GB", "TB"};
    std::size_t unit = 0;
    while (bytes >= 1024.0 && unit + 1 < kUnits.size()) {
        bytes /= 1024.0;
        ++unit;
    }
    return std::format("{:.2f} {}", bytes, kUnits[unit]);
}

std::string Duration(double seconds) {
    // NaN maps to 0 through std::max, infinity to the cap
    auto total = static_cast<long long>(std::min(std::max(0.0, seconds), kMaxDurationSeconds));
    return std::format("{:02}:{:02}:{:02}", total / 3600, (total % 3600) / 60, total % 60);
}

std::string StatusText(TransferDirection direction,
                       std::string_view file_name,
                       const ProgressSnapshot& snapshot,
                       std::size_t bar_width) {
    std::string text = direction == TransferDirection::kDownload ? "DOWNLOADING\n" : "UPLOADING\n";
    if (!file_name.empty()) {
        text += std::format("File: {}\n", file_name);
    }

    if (snapshot.percentage) {
        text += std::format("Progress: [{}] {:.1f}%\n",
                            ProgressBar(*snapshot.percentage, bar_width),
                            *snapshot.percentage);
        text += std::format("Size: {} / {}\n",
                            HumanBytes(static_cast<double>(snapshot.current_bytes)),
                            HumanBytes(static_cast<double>(snapshot.total_bytes)));
    } else {
        text += std::format("Size: {}\n", HumanBytes(static_cast<double>(snapshot.current_bytes)));
    }

    text += std::format("Speed: {}/s\n", HumanBytes(snapshot.smoothed_speed));
    text += std::format("ETA: {}\n",
                        snapshot.eta_seconds ? Duration(*snapshot.eta_seconds) : "calculating");
    text += std::format("Elapsed: {}", Duration(snapshot.elapsed_seconds));
    return text;
}

std::string CompletionText(TransferDirection direction,
                           std::string_view file_name,
                           std::uint64_t bytes,
                           double elapsed_seconds,
                           double average_speed) {
    std::string text = direction == TransferDirection::kDownload ? "DOWNLOAD COMPLETE\n"
                                                                 : "UPLOAD COMPLETE\n";
    if (!file_name.empty()) {
        text += std::format("File: {}\n", file_name);
    }
    text += std::format("Size: {}\n", HumanBytes(static_cast<double>(bytes)));
    text += std::format("Total time: {}\n", Duration(elapsed_seconds));
    text += std::format("Average speed: {}/s", HumanBytes(average_speed));
    return text;
}

} // namespace fileferry::core::render
