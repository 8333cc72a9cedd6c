#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <cstdint>
#include <functional>

namespace fileferry::core {

// Called by the transport after each chunk with the bytes moved so far.
using ProgressHandler = std::function<void(std::uint64_t current_bytes, std::uint64_t total_bytes)>;

// Moves the bytes of one transfer. Run() returns once everything arrived and throws
// on failure. Exceptions thrown by the handler must be let through.
class TransferTransport {
public:
    virtual ~TransferTransport() = default;

    virtual boost::asio::awaitable<void> Run(ProgressHandler on_progress) = 0;
};

} // namespace fileferry::core
