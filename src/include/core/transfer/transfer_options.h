#pragma once

#include <chrono>
#include <core/constant/transfer.h>
#include <cstddef>
#include <cstdint>

namespace fileferry::core {

struct TransferOptions {
    std::chrono::milliseconds min_sample_interval = transfer::kMinSampleInterval;
    std::chrono::milliseconds notify_interval = transfer::kNotifyInterval;
    std::size_t speed_window = transfer::kSpeedWindowSize;
    std::size_t progress_bar_width = transfer::kProgressBarWidth;
    std::uint64_t max_file_size = transfer::kMaxFileSize; // 0 disables the check

    // Built from the loaded configuration.
    static TransferOptions FromConfigSettings();
};

} // namespace fileferry::core
