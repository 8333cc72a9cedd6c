#pragma once

#include <cstddef>
#include <list>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace fileferry::core {

// Bounded set of recently seen ids. Once full, the least recently seen id is evicted.
class RecentIdCache {
public:
    explicit RecentIdCache(std::size_t capacity);

    // Returns false if the id was already present (and refreshes it).
    bool Insert(std::string_view id);
    bool Contains(std::string_view id) const;

    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }

private:
    std::size_t capacity_;
    std::list<std::string> lru_order_; // front is oldest, back is newest
    std::unordered_map<std::string, std::list<std::string>::iterator> index_;
    mutable std::mutex mutex_;
};

} // namespace fileferry::core
