#pragma once

#include <core/model/media_kind.h>
#include <core/model/transfer_direction.h>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace fileferry::core::feedback {

struct TransferStarted {
    std::string session_id;
    std::string user_id;
    TransferDirection direction;
    std::string display_name;
    std::uint64_t total_bytes;
    MediaKind upload_as;
    std::string caption;
    bool has_thumbnail = false;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(TransferStarted,
                                   session_id,
                                   user_id,
                                   direction,
                                   display_name,
                                   total_bytes,
                                   upload_as,
                                   caption,
                                   has_thumbnail);
};

} // namespace fileferry::core::feedback
