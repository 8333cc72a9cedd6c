#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace fileferry::core::feedback {

// The request broke an admission rule; nothing was started.
struct RequestRejected {
    std::string user_id;
    std::string request_id;
    std::string reason;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(RequestRejected, user_id, request_id, reason);
};

} // namespace fileferry::core::feedback
