#include <utility>
#include <boost/asio/post.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/transfer/local_copy_transport.h>
#include <core/transfer/transfer_error.h>
#include <fstream>
#include <spdlog/spdlog.h>
#include <vector>

namespace net = boost::asio;
namespace fs = std::filesystem;

namespace fileferry::core {

LocalCopyTransport::LocalCopyTransport(std::filesystem::path source,
                                       std::filesystem::path destination,
                                       std::uint64_t chunk_size)
    : source_(std::move(source))
    , destination_(std::move(destination))
    , partial_(destination_.string() + ".part")
    , chunk_size_(chunk_size == 0 ? transfer::kDefaultChunkSize : chunk_size) {}

std::uint64_t LocalCopyTransport::total_bytes() const {
    std::error_code ec;
    auto size = fs::file_size(source_, ec);
    return ec ? 0 : size;
}

net::awaitable<void> LocalCopyTransport::Run(ProgressHandler on_progress) {
    std::ifstream in(source_, std::ios::binary);
    if (!in) {
        throw TransportError("Failed to open " + source_.string());
    }

    if (destination_.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(destination_.parent_path(), ec);
        if (ec) {
            throw TransportError("Failed to create " + destination_.parent_path().string() + ": "
                                 + ec.message());
        }
    }
    std::ofstream out(partial_, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw TransportError("Failed to open " + partial_.string() + " for writing");
    }

    const auto total = total_bytes();
    spdlog::debug("Copying {} -> {} ({} bytes)", source_.string(), destination_.string(), total);

    auto executor = co_await net::this_coro::executor;
    std::vector<char> buffer(chunk_size_);
    std::uint64_t copied = 0;
    while (copied < total) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto read = in.gcount();
        if (read <= 0) {
            throw TransportError("Unexpected end of " + source_.string() + " after "
                                 + std::to_string(copied) + " bytes");
        }
        out.write(buffer.data(), read);
        if (!out) {
            throw TransportError("Failed to write " + partial_.string());
        }
        copied += static_cast<std::uint64_t>(read);

        if (on_progress) {
            on_progress(copied, total);
        }
        // let timers and the notification coroutine run between chunks
        co_await net::post(executor, net::use_awaitable);
    }

    out.close();
    if (!out) {
        throw TransportError("Failed to flush " + partial_.string());
    }

    std::error_code ec;
    fs::rename(partial_, destination_, ec);
    if (ec) {
        throw TransportError("Failed to move " + partial_.string() + " to " + destination_.string()
                             + ": " + ec.message());
    }
}

} // namespace fileferry::core
