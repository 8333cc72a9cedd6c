#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <core/model/emit_result.h>
#include <string>

namespace fileferry::core {

// Where rendered progress updates are delivered (a chat message edit, a console line...).
class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    virtual boost::asio::awaitable<EmitResult> Emit(std::string session_id, std::string text) = 0;
};

} // namespace fileferry::core
