#pragma once

#include <unordered_map>
#include <list>
#include <mutex>
#include <optional>
#include <chrono>
#include <vector>
#include <string>

namespace campus_rag {

// Thread-safe LRU map with per-entry expiry. A capacity of 0 disables caching.
template<typename Key, typename Value>
class LRUCache {
public:
    explicit LRUCache(size_t max_size, std::chrono::seconds ttl = std::chrono::seconds(300))
        : max_size_(max_size), ttl_(ttl) {}

    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = cache_map_.find(key);
        if (it == cache_map_.end()) {
            ++misses_;
            return std::nullopt;
        }

        if (std::chrono::steady_clock::now() > it->second.expiry_time) {
            cache_list_.erase(it->second.list_it);
            cache_map_.erase(it);
            ++misses_;
            return std::nullopt;
        }

        cache_list_.splice(cache_list_.begin(), cache_list_, it->second.list_it);
        ++hits_;
        return it->second.value;
    }

    void set(const Key& key, const Value& value) {
        if (max_size_ == 0) return;
        std::lock_guard<std::mutex> lock(mutex_);

        auto expiry = std::chrono::steady_clock::now() + ttl_;

        auto it = cache_map_.find(key);
        if (it != cache_map_.end()) {
            it->second.value = value;
            it->second.expiry_time = expiry;
            cache_list_.splice(cache_list_.begin(), cache_list_, it->second.list_it);
            return;
        }

        if (cache_map_.size() >= max_size_) {
            cache_map_.erase(cache_list_.back());
            cache_list_.pop_back();
        }

        cache_list_.push_front(key);
        cache_map_[key] = {value, cache_list_.begin(), expiry};
    }

    bool erase(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_map_.find(key);
        if (it == cache_map_.end()) return false;
        cache_list_.erase(it->second.list_it);
        cache_map_.erase(it);
        return true;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_map_.clear();
        cache_list_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_map_.size();
    }

    size_t hits() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return hits_;
    }

    size_t misses() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return misses_;
    }

private:
    struct CacheEntry {
        Value value;
        typename std::list<Key>::iterator list_it;
        std::chrono::steady_clock::time_point expiry_time;
    };

    size_t max_size_;
    std::chrono::seconds ttl_;
    std::list<Key> cache_list_;
    std::unordered_map<Key, CacheEntry> cache_map_;
    size_t hits_ = 0;
    size_t misses_ = 0;
    mutable std::mutex mutex_;
};

using EmbeddingCache = LRUCache<std::string, std::vector<float>>;

} // namespace campus_rag
