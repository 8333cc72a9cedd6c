#pragma once

#include "notification_sink.h"
#include <iosfwd>

namespace fileferry::core {

// Prints every update to a stream, overwriting the previous one on a terminal.
class ConsoleSink : public NotificationSink {
public:
    explicit ConsoleSink(std::ostream& out);

    boost::asio::awaitable<EmitResult> Emit(std::string session_id, std::string text) override;

private:
    std::ostream& out_;
    std::size_t last_line_count_{0};
};

} // namespace fileferry::core
