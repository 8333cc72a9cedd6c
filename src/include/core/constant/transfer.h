#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace fileferry::core {

namespace transfer {

constexpr size_t kDefaultChunkSize = 1 * 1024 * 1024; // 1 MB

constexpr std::chrono::milliseconds kMinSampleInterval{500};
constexpr std::chrono::milliseconds kNotifyInterval{2000};
constexpr size_t kSpeedWindowSize = 5;
constexpr size_t kProgressBarWidth = 20;

constexpr size_t kRecentRequestCapacity = 1000;

constexpr std::uint64_t kMaxFileSize = 4ULL * 1024 * 1024 * 1024; // 4 GB
constexpr size_t kMaxFileNameLength = 255;

} // namespace transfer

} // namespace fileferry::core
