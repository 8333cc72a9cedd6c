#pragma once

#include "transfer_transport.h"
#include <core/constant/transfer.h>
#include <cstdint>
#include <filesystem>

namespace fileferry::core {

// Copies a local file chunk by chunk, yielding to the event loop between chunks.
// Bytes go to "<destination>.part", renamed over the destination once complete, so an
// existing destination is only replaced by a finished copy.
class LocalCopyTransport : public TransferTransport {
public:
    LocalCopyTransport(std::filesystem::path source,
                       std::filesystem::path destination,
                       std::uint64_t chunk_size = transfer::kDefaultChunkSize);

    boost::asio::awaitable<void> Run(ProgressHandler on_progress) override;

    std::uint64_t total_bytes() const;
    const std::filesystem::path& destination() const { return destination_; }
    // The only file a failed or cancelled copy leaves behind.
    const std::filesystem::path& artifact_path() const { return partial_; }

private:
    std::filesystem::path source_;
    std::filesystem::path destination_;
    std::filesystem::path partial_;
    std::uint64_t chunk_size_;
};

} // namespace fileferry::core
