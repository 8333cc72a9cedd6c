#include <algorithm>
#include <cctype>
#include <chrono>
#include <core/storage/json_file.h>
#include <core/storage/user_settings_store.h>
#include <format>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace fileferry::core {

static constexpr std::string_view kPrefixStore = "prefixes.json";
static constexpr std::string_view kCaptionStore = "captions.json";
static constexpr std::string_view kThumbnailStore = "thumbnails.json";
static constexpr std::string_view kPreferenceStore = "preferences.json";

UserSettingsStore::UserSettingsStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {
    std::error_code ec;
    if (!fs::exists(directory_, ec)) {
        spdlog::info("Settings directory does not exist, creating...");
        fs::create_directories(directory_, ec);
        if (ec) {
            spdlog::error("Failed to create \"{}\": {}", directory_.string(), ec.message());
        }
    }
}

json UserSettingsStore::load(std::string_view store) const {
    return json_file::LoadObject(directory_ / store);
}

bool UserSettingsStore::save(std::string_view store, const json& data) const {
    return json_file::Save(directory_ / store, data);
}

std::optional<std::string> UserSettingsStore::getString(std::string_view store,
                                                        std::string_view user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto data = load(store);
    auto it = data.find(std::string(user_id));
    if (it == data.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

bool UserSettingsStore::setString(std::string_view store,
                                  std::string_view user_id,
                                  std::string_view value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto data = load(store);
    data[std::string(user_id)] = std::string(value);
    return save(store, data);
}

std::string UserSettingsStore::GetPrefix(std::string_view user_id) const {
    return getString(kPrefixStore, user_id).value_or("");
}

bool UserSettingsStore::SetPrefix(std::string_view user_id, std::string_view prefix) {
    return setString(kPrefixStore, user_id, prefix);
}

UploadMode UserSettingsStore::GetUploadMode(std::string_view user_id) const {
    auto mode = getString(kPreferenceStore, user_id);
    if (!mode) {
        return UploadMode::kAuto;
    }
    // unknown strings map to the first enum entry, kAuto
    return json(*mode).get<UploadMode>();
}

bool UserSettingsStore::SetUploadMode(std::string_view user_id, UploadMode mode) {
    return setString(kPreferenceStore, user_id, json(mode).get<std::string>());
}

std::optional<std::string> UserSettingsStore::GetCaption(std::string_view user_id) const {
    return getString(kCaptionStore, user_id);
}

bool UserSettingsStore::SetCaption(std::string_view user_id, std::string_view caption) {
    return setString(kCaptionStore, user_id, caption);
}

std::optional<std::filesystem::path> UserSettingsStore::GetThumbnail(std::string_view user_id) const {
    auto thumbnail = getString(kThumbnailStore, user_id);
    if (!thumbnail) {
        return std::nullopt;
    }
    std::error_code ec;
    if (!fs::exists(*thumbnail, ec)) {
        return std::nullopt;
    }
    return fs::path(*thumbnail);
}

bool UserSettingsStore::SetThumbnail(std::string_view user_id,
                                     const std::filesystem::path& thumbnail) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto dir = thumbnailDir();
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        spdlog::error("Failed to create \"{}\": {}", dir.string(), ec.message());
        return false;
    }

    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                       .count();
    std::string owner(user_id);
    std::replace_if(
        owner.begin(),
        owner.end(),
        [](unsigned char c) { return !std::isalnum(c) && c != '-' && c != '_'; },
        '_');
    auto copy = dir / std::format("{}_{}{}", owner, seconds, thumbnail.extension().string());
    fs::copy_file(thumbnail, copy, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        spdlog::error("Failed to copy thumbnail \"{}\": {}", thumbnail.string(), ec.message());
        return false;
    }

    auto data = load(kThumbnailStore);
    auto key = std::string(user_id);
    auto it = data.find(key);
    if (it != data.end() && it->is_string() && it->get<std::string>() != copy.string()) {
        removeOwnedThumbnail(it->get<std::string>());
    }
    data[key] = copy.string();
    return save(kThumbnailStore, data);
}

bool UserSettingsStore::DeleteThumbnail(std::string_view user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto data = load(kThumbnailStore);
    auto it = data.find(std::string(user_id));
    if (it == data.end()) {
        return false;
    }
    if (it->is_string()) {
        removeOwnedThumbnail(it->get<std::string>());
    }
    data.erase(it);
    return save(kThumbnailStore, data);
}

std::filesystem::path UserSettingsStore::thumbnailDir() const {
    return directory_ / "thumbnails";
}

// Only copies made by SetThumbnail are deleted, never a file the store does not own.
void UserSettingsStore::removeOwnedThumbnail(const std::filesystem::path& thumbnail) const {
    std::error_code dir_ec;
    std::error_code file_ec;
    auto dir = fs::weakly_canonical(thumbnailDir(), dir_ec);
    auto file = fs::weakly_canonical(thumbnail, file_ec);
    if (dir_ec || file_ec || file.parent_path() != dir) {
        spdlog::warn("Thumbnail \"{}\" is not owned by the store, keeping it", thumbnail.string());
        return;
    }
    std::error_code ec;
    fs::remove(file, ec);
    if (ec) {
        spdlog::error("Failed to delete thumbnail \"{}\": {}", file.string(), ec.message());
    }
}

} // namespace fileferry::core
