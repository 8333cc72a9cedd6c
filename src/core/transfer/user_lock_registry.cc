#include <core/transfer/user_lock_registry.h>
#include <spdlog/spdlog.h>
#include <utility>

namespace fileferry::core {

UserLockGuard::UserLockGuard(UserLockRegistry& registry, std::string user_id)
    : registry_(&registry)
    , user_id_(std::move(user_id)) {}

UserLockGuard::~UserLockGuard() {
    Release();
}

UserLockGuard::UserLockGuard(UserLockGuard&& other) noexcept
    : registry_(std::exchange(other.registry_, nullptr))
    , user_id_(std::move(other.user_id_)) {}

UserLockGuard& UserLockGuard::operator=(UserLockGuard&& other) noexcept {
    if (this != &other) {
        Release();
        registry_ = std::exchange(other.registry_, nullptr);
        user_id_ = std::move(other.user_id_);
    }
    return *this;
}

void UserLockGuard::Release() {
    if (registry_) {
        std::exchange(registry_, nullptr)->Release(user_id_);
    }
}

bool UserLockRegistry::TryAcquire(std::string_view user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = busy_.try_emplace(std::string(user_id), false);
    if (it->second) {
        return false;
    }
    it->second = true;
    return true;
}

void UserLockRegistry::Release(std::string_view user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = busy_.find(std::string(user_id));
    if (it == busy_.end() || !it->second) {
        spdlog::warn("Releasing user {} which holds no lock", user_id);
        return;
    }
    it->second = false;
}

bool UserLockRegistry::IsBusy(std::string_view user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = busy_.find(std::string(user_id));
    return it != busy_.end() && it->second;
}

std::optional<UserLockGuard> UserLockRegistry::TryLock(std::string_view user_id) {
    if (!TryAcquire(user_id)) {
        return std::nullopt;
    }
    return UserLockGuard(*this, std::string(user_id));
}

} // namespace fileferry::core
