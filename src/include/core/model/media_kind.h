#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace fileferry::core {

// How a file is presented once uploaded.
enum class MediaKind {
    kDocument,
    kVideo,
    kAudio,
    kPhoto,
};

NLOHMANN_JSON_SERIALIZE_ENUM(MediaKind,
                             {
                                 {MediaKind::kDocument, "document"},
                                 {MediaKind::kVideo, "video"},
                                 {MediaKind::kAudio, "audio"},
                                 {MediaKind::kPhoto, "photo"},
                             })

inline std::string_view MediaKindToString(MediaKind kind) {
    switch (kind) {
    case MediaKind::kDocument:
        return "document";
    case MediaKind::kVideo:
        return "video";
    case MediaKind::kAudio:
        return "audio";
    case MediaKind::kPhoto:
        return "photo";
    }
    return "document";
}

inline MediaKind GetMediaKind(std::string_view file_name) {
    std::filesystem::path path(file_name);
    std::string ext = path.extension().string();

    if (ext.empty() || ext == ".") {
        return MediaKind::kDocument;
    }

    ext = ext.substr(1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return std::tolower(c);
    });

    if (ext == "jpg" || ext == "jpeg" || ext == "png" || ext == "gif" || ext == "bmp"
        || ext == "webp") {
        return MediaKind::kPhoto;
    }

    if (ext == "mp4" || ext == "avi" || ext == "mkv" || ext == "mov" || ext == "wmv" || ext == "flv"
        || ext == "webm" || ext == "m4v") {
        return MediaKind::kVideo;
    }

    if (ext == "mp3" || ext == "wav" || ext == "ogg" || ext == "flac" || ext == "aac"
        || ext == "m4a" || ext == "opus") {
        return MediaKind::kAudio;
    }

    return MediaKind::kDocument;
}

} // namespace fileferry::core
