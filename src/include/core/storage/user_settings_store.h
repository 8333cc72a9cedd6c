#pragma once

#include <core/model/upload_mode.h>
#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace fileferry::core {

/*
    Per-user display preferences, one json object per concern, keyed by user id:

        prefixes.json     {"42": "[HD] "}
        captions.json     {"42": "Uploaded by 42"}
        thumbnails.json   {"42": "<directory>/thumbnails/42_1700000000.jpg"}
        preferences.json  {"42": "video"}

    Reads of a missing or unreadable file behave as if it were empty.
*/
class UserSettingsStore {
public:
    explicit UserSettingsStore(std::filesystem::path directory);

    std::string GetPrefix(std::string_view user_id) const;
    bool SetPrefix(std::string_view user_id, std::string_view prefix);

    UploadMode GetUploadMode(std::string_view user_id) const;
    bool SetUploadMode(std::string_view user_id, UploadMode mode);

    std::optional<std::string> GetCaption(std::string_view user_id) const;
    bool SetCaption(std::string_view user_id, std::string_view caption);

    // Only returned if the file still exists.
    std::optional<std::filesystem::path> GetThumbnail(std::string_view user_id) const;
    // Stores a private copy of the image under <directory>/thumbnails, replacing the
    // previous copy. The given file is left untouched.
    bool SetThumbnail(std::string_view user_id, const std::filesystem::path& thumbnail);
    // Forgets the thumbnail and deletes the private copy.
    bool DeleteThumbnail(std::string_view user_id);

    const std::filesystem::path& directory() const { return directory_; }

private:
    nlohmann::json load(std::string_view store) const;
    bool save(std::string_view store, const nlohmann::json& data) const;
    std::optional<std::string> getString(std::string_view store, std::string_view user_id) const;
    bool setString(std::string_view store, std::string_view user_id, std::string_view value);
    std::filesystem::path thumbnailDir() const;
    void removeOwnedThumbnail(const std::filesystem::path& thumbnail) const;

    std::filesystem::path directory_;
    mutable std::mutex mutex_;
};

} // namespace fileferry::core
