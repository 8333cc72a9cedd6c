#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace fileferry::core::feedback {

struct UserBusy {
    std::string user_id;
    std::string request_id;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(UserBusy, user_id, request_id);
};

struct DuplicateRequest {
    std::string user_id;
    std::string request_id;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(DuplicateRequest, user_id, request_id);
};

} // namespace fileferry::core::feedback
