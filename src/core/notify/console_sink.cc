#include <algorithm>
#include <core/notify/console_sink.h>
#include <ostream>

namespace fileferry::core {

ConsoleSink::ConsoleSink(std::ostream& out)
    : out_(out) {}

boost::asio::awaitable<EmitResult> ConsoleSink::Emit(std::string session_id, std::string text) {
    // move back over the previous update and clear it
    if (last_line_count_ > 0) {
        out_ << "\033[" << last_line_count_ << "F\033[J";
    }
    out_ << text << '\n' << std::flush;
    if (!out_) {
        co_return emit::PermanentError{"console stream is not writable (session " + session_id
                                       + ")"};
    }
    last_line_count_ = static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n')) + 1;
    co_return emit::Delivered{};
}

} // namespace fileferry::core
