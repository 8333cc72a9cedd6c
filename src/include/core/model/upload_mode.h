#pragma once

#include "media_kind.h"
#include <nlohmann/json.hpp>
#include <string_view>

namespace fileferry::core {

// Per-user preference for how uploads are sent. kAuto picks by file extension.
enum class UploadMode {
    kAuto,
    kDocument,
    kVideo,
    kAudio,
};

NLOHMANN_JSON_SERIALIZE_ENUM(UploadMode,
                             {
                                 {UploadMode::kAuto, "auto"},
                                 {UploadMode::kDocument, "document"},
                                 {UploadMode::kVideo, "video"},
                                 {UploadMode::kAudio, "audio"},
                             })

inline MediaKind ResolveUploadMode(UploadMode mode, std::string_view file_name) {
    switch (mode) {
    case UploadMode::kDocument:
        return MediaKind::kDocument;
    case UploadMode::kVideo:
        return MediaKind::kVideo;
    case UploadMode::kAudio:
        return MediaKind::kAudio;
    case UploadMode::kAuto:
        break;
    }
    return GetMediaKind(file_name);
}

// Thumbnails are only attached to these kinds.
inline bool SupportsThumbnail(MediaKind kind) {
    return kind == MediaKind::kVideo || kind == MediaKind::kAudio || kind == MediaKind::kDocument;
}

} // namespace fileferry::core
