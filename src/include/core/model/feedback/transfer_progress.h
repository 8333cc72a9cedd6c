#pragma once

#include <core/model/progress_snapshot.h>
#include <nlohmann/json.hpp>
#include <string>

namespace fileferry::core::feedback {

struct TransferProgress {
    std::string session_id;
    ProgressSnapshot snapshot;
};

inline void to_json(nlohmann::json& j, const TransferProgress& progress) {
    j = nlohmann::json{{"session_id", progress.session_id}, {"snapshot", progress.snapshot}};
}

} // namespace fileferry::core::feedback
