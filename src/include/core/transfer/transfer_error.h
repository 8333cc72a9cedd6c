#pragma once

#include <stdexcept>
#include <string>

namespace fileferry::core {

// The transfer itself failed: network fault, remote rejection, local I/O error.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Thrown out of the progress handler once a cancellation request has been observed.
class TransferCancelled : public std::runtime_error {
public:
    TransferCancelled()
        : std::runtime_error("transfer cancelled") {}
};

} // namespace fileferry::core
