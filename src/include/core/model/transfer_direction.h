#pragma once

#include <nlohmann/json.hpp>

namespace fileferry::core {

enum class TransferDirection {
    kDownload,
    kUpload,
};

NLOHMANN_JSON_SERIALIZE_ENUM(TransferDirection,
                             {
                                 {TransferDirection::kDownload, "Download"},
                                 {TransferDirection::kUpload, "Upload"},
                             })

} // namespace fileferry::core
