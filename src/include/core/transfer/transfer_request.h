#pragma once

#include <core/model/transfer_direction.h>
#include <cstdint>
#include <filesystem>
#include <string>

namespace fileferry::core {

struct TransferRequest {
    std::string request_id; // used to drop duplicates, may be empty
    std::string user_id;
    TransferDirection direction = TransferDirection::kDownload;
    std::string file_name;
    std::uint64_t total_bytes = 0; // 0 when unknown
    std::filesystem::path artifact_path; // created by this transfer only, removed if it does not complete
};

} // namespace fileferry::core
