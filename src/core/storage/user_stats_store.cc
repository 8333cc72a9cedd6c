#include <core/storage/json_file.h>
#include <core/storage/user_stats_store.h>
#include <algorithm>
#include <ctime>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace fileferry::core {

static constexpr std::string_view kUserStore = "users.json";
static constexpr std::string_view kGlobalStore = "stats.json";

static std::string utcNow() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buffer[32];
    auto n = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buffer, n);
}

static std::uint64_t counter(const json& object, std::string_view key) {
    auto it = object.find(std::string(key));
    if (it == object.end() || !it->is_number_integer()) {
        return 0;
    }
    if (it->is_number_unsigned()) {
        return it->get<std::uint64_t>();
    }
    return static_cast<std::uint64_t>(std::max<std::int64_t>(it->get<std::int64_t>(), 0));
}

UserStatsStore::UserStatsStore(std::filesystem::path directory)
    : directory_(std::move(directory))
    , started_(std::chrono::steady_clock::now()) {
    std::error_code ec;
    if (!fs::exists(directory_, ec)) {
        spdlog::info("Stats directory does not exist, creating...");
        fs::create_directories(directory_, ec);
        if (ec) {
            spdlog::error("Failed to create \"{}\": {}", directory_.string(), ec.message());
        }
    }
}

json& UserStatsStore::touch(json& users, std::string_view user_id) const {
    auto now = utcNow();
    auto& user = users[std::string(user_id)];
    if (!user.is_object()) {
        spdlog::info("First activity of user {}", user_id);
        user = json{
            {"joined_at", now},
            {"files_processed", std::uint64_t{0}},
            {"bytes_processed", std::uint64_t{0}},
        };
    }
    user["last_active"] = now;
    return user;
}

bool UserStatsStore::TouchUser(std::string_view user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto users = json_file::LoadObject(directory_ / kUserStore);
    touch(users, user_id);
    return json_file::Save(directory_ / kUserStore, users);
}

bool UserStatsStore::RecordCompleted(std::string_view user_id, std::uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto users = json_file::LoadObject(directory_ / kUserStore);
    auto& user = touch(users, user_id);
    user["files_processed"] = counter(user, "files_processed") + 1;
    user["bytes_processed"] = counter(user, "bytes_processed") + bytes;

    auto totals = json_file::LoadObject(directory_ / kGlobalStore);
    totals["total_files"] = counter(totals, "total_files") + 1;
    totals["total_bytes"] = counter(totals, "total_bytes") + bytes;

    bool saved = json_file::Save(directory_ / kUserStore, users);
    return json_file::Save(directory_ / kGlobalStore, totals) && saved;
}

std::optional<UserStats> UserStatsStore::GetUser(std::string_view user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto users = json_file::LoadObject(directory_ / kUserStore);
    auto it = users.find(std::string(user_id));
    if (it == users.end() || !it->is_object()) {
        return std::nullopt;
    }
    return UserStats{
        .joined_at = it->value("joined_at", std::string()),
        .last_active = it->value("last_active", std::string()),
        .files_processed = counter(*it, "files_processed"),
        .bytes_processed = counter(*it, "bytes_processed"),
    };
}

GlobalStats UserStatsStore::GetGlobal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto totals = json_file::LoadObject(directory_ / kGlobalStore);
    return GlobalStats{
        .total_files = counter(totals, "total_files"),
        .total_bytes = counter(totals, "total_bytes"),
    };
}

std::chrono::seconds UserStatsStore::uptime() const {
    return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now()
                                                            - started_);
}

} // namespace fileferry::core
