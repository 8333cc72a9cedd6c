#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace fileferry::core {

class UserLockRegistry;

// Holds a user's lock and releases it exactly once, on Release() or destruction.
class UserLockGuard {
public:
    UserLockGuard() = default;
    UserLockGuard(UserLockRegistry& registry, std::string user_id);
    ~UserLockGuard();

    UserLockGuard(UserLockGuard&& other) noexcept;
    UserLockGuard& operator=(UserLockGuard&& other) noexcept;
    UserLockGuard(const UserLockGuard&) = delete;
    UserLockGuard& operator=(const UserLockGuard&) = delete;

    void Release();

    bool owns_lock() const { return registry_ != nullptr; }
    const std::string& user_id() const { return user_id_; }

private:
    UserLockRegistry* registry_ = nullptr;
    std::string user_id_;
};

// At most one active transfer per user. Entries are created on first use and only ever
// flipped back to free, never erased.
class UserLockRegistry {
public:
    UserLockRegistry() = default;
    UserLockRegistry(const UserLockRegistry&) = delete;
    UserLockRegistry& operator=(const UserLockRegistry&) = delete;

    bool TryAcquire(std::string_view user_id);
    void Release(std::string_view user_id);
    bool IsBusy(std::string_view user_id) const;

    std::optional<UserLockGuard> TryLock(std::string_view user_id);

private:
    std::unordered_map<std::string, bool> busy_;
    mutable std::mutex mutex_;
};

} // namespace fileferry::core
