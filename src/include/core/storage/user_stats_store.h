#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace fileferry::core {

struct UserStats {
    std::string joined_at;   // UTC, ISO 8601
    std::string last_active; // UTC, ISO 8601
    std::uint64_t files_processed = 0;
    std::uint64_t bytes_processed = 0;
};

struct GlobalStats {
    std::uint64_t total_files = 0;
    std::uint64_t total_bytes = 0;
};

/*
    Activity counters kept next to the user settings:

        users.json  {"42": {"joined_at": "2024-01-01T12:00:00Z", "last_active": ...,
                            "files_processed": 3, "bytes_processed": 1048576}}
        stats.json  {"total_files": 3, "total_bytes": 1048576}

    Only completed transfers are counted.
*/
class UserStatsStore {
public:
    explicit UserStatsStore(std::filesystem::path directory);

    // Creates the record on first sight, then refreshes last_active.
    bool TouchUser(std::string_view user_id);
    bool RecordCompleted(std::string_view user_id, std::uint64_t bytes);

    std::optional<UserStats> GetUser(std::string_view user_id) const;
    GlobalStats GetGlobal() const;

    // Time since this store was created, i.e. since the process started serving.
    std::chrono::seconds uptime() const;

private:
    nlohmann::json& touch(nlohmann::json& users, std::string_view user_id) const;

    std::filesystem::path directory_;
    std::chrono::steady_clock::time_point started_;
    mutable std::mutex mutex_;
};

} // namespace fileferry::core
