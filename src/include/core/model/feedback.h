#pragma once

#include "feedback/feedback_type.h"
#include "feedback/request_rejected.h"
#include "feedback/transfer_ended.h"
#include "feedback/transfer_progress.h"
#include "feedback/transfer_started.h"
#include "feedback/transfer_throttled.h"
#include "feedback/user_busy.h"
#include <functional>
#include <nlohmann/json.hpp>

namespace fileferry::core {

struct Feedback {
    FeedbackType type;
    nlohmann::json data;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Feedback, type, data);
};

using FeedbackCallback = std::function<void(Feedback&&)>;

} // namespace fileferry::core
