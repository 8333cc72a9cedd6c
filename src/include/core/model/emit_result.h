#pragma once

#include <chrono>
#include <string>
#include <variant>

namespace fileferry::core {

namespace emit {

struct Delivered {};

// The sink refused the update for now and told us how long to wait.
struct RateLimited {
    std::chrono::milliseconds retry_after;
};

struct PermanentError {
    std::string message;
};

} // namespace emit

using EmitResult = std::variant<emit::Delivered, emit::RateLimited, emit::PermanentError>;

} // namespace fileferry::core
