#include <algorithm>
#include <core/util/recent_id_cache.h>
#include <iterator>

namespace fileferry::core {

RecentIdCache::RecentIdCache(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

bool RecentIdCache::Insert(std::string_view id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string key(id);
    auto it = index_.find(key);
    if (it != index_.end()) {
        lru_order_.splice(lru_order_.end(), lru_order_, it->second);
        return false;
    }
    if (lru_order_.size() >= capacity_) {
        index_.erase(lru_order_.front());
        lru_order_.pop_front();
    }
    lru_order_.push_back(key);
    index_.emplace(std::move(key), std::prev(lru_order_.end()));
    return true;
}

bool RecentIdCache::Contains(std::string_view id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.contains(std::string(id));
}

std::size_t RecentIdCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lru_order_.size();
}

} // namespace fileferry::core
