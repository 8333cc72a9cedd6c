#pragma once

#include <core/constant/transfer.h>
#include <core/model/progress_snapshot.h>
#include <core/model/transfer_direction.h>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fileferry::core::render {

// "[█████░░░░░...]": floor(width * percentage / 100) full glyphs, the rest empty.
std::string ProgressBar(double percentage, std::size_t width = transfer::kProgressBarWidth);

// 1536 -> "1.50 KB"
std::string HumanBytes(double bytes);

// 3725 -> "01:02:05". Negative and NaN read as 0, huge values are capped at 1e15 s.
std::string Duration(double seconds);

// Multi-line status text for one snapshot, e.g.
//   DOWNLOADING
//   File: report.pdf
//   Progress: [██████░░░░░░░░░░░░░░] 30.0%
//   Size: 30.00 MB / 100.00 MB
//   Speed: 10.00 MB/s
//   ETA: 00:00:07
//   Elapsed: 00:00:03
std::string StatusText(TransferDirection direction,
                       std::string_view file_name,
                       const ProgressSnapshot& snapshot,
                       std::size_t bar_width = transfer::kProgressBarWidth);

// Summary shown once a transfer completed:
//   DOWNLOAD COMPLETE
//   File: report.pdf
//   Size: 100.00 MB
//   Total time: 00:00:05
//   Average speed: 20.00 MB/s
std::string CompletionText(TransferDirection direction,
                           std::string_view file_name,
                           std::uint64_t bytes,
                           double elapsed_seconds,
                           double average_speed);

} // namespace fileferry::core::render
