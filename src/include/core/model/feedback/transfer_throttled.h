#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace fileferry::core::feedback {

struct TransferThrottled {
    std::string session_id;
    std::int64_t retry_after_ms;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(TransferThrottled, session_id, retry_after_ms);
};

} // namespace fileferry::core::feedback
