#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace mediadex {

/**
 * @brief Configuration for a bounded cache
 */
struct BoundedCacheConfig {
    size_t maxSize = 100;              ///< Maximum number of live entries
    std::chrono::milliseconds ttl{300'000}; ///< Age after which an entry counts as a miss
};

/**
 * @brief Snapshot of cache counters
 */
struct BoundedCacheStats {
    size_t size = 0;
    size_t maxSize = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;

    double hitRate() const {
        const auto total = hits + misses;
        return total == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(total);
    }
};

/**
 * @brief Thread-safe key/value cache bounded by entry count and age
 *
 * Eviction at capacity removes the entry with the oldest insertion time.
 * Reads do not refresh an entry's position. Expired entries are removed
 * lazily when looked up.
 */
template <typename Key, typename Value, typename Hash = std::hash<Key>,
          typename Clock = std::chrono::steady_clock>
class BoundedCache {
public:
    explicit BoundedCache(BoundedCacheConfig config = {}) : config_(config) {
        if (config_.maxSize == 0) {
            config_.maxSize = 1;
        }
    }

    BoundedCache(const BoundedCache&) = delete;
    BoundedCache& operator=(const BoundedCache&) = delete;

    /**
     * @brief Look up a key
     * @return nullopt if not present or older than the TTL
     */
    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            ++misses_;
            return std::nullopt;
        }
        if (Clock::now() - it->second.storedAt >= config_.ttl) {
            entries_.erase(it);
            ++misses_;
            return std::nullopt;
        }
        ++hits_;
        return it->second.value;
    }

    /**
     * @brief Insert or overwrite a key
     *
     * Overwriting an existing key refreshes its timestamp and never evicts.
     */
    void set(const Key& key, Value value) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Clock::now();
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            it->second.value = std::move(value);
            it->second.storedAt = now;
            return;
        }
        if (entries_.size() >= config_.maxSize) {
            evictOldestLocked();
        }
        entries_.emplace(key, Entry{std::move(value), now});
    }

    void invalidate(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.erase(key);
    }

    /**
     * @brief Drop all entries and reset the hit/miss counters
     */
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        hits_ = 0;
        misses_ = 0;
        evictions_ = 0;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    BoundedCacheStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        BoundedCacheStats s;
        s.size = entries_.size();
        s.maxSize = config_.maxSize;
        s.hits = hits_;
        s.misses = misses_;
        s.evictions = evictions_;
        return s;
    }

    const BoundedCacheConfig& config() const { return config_; }

private:
    struct Entry {
        Value value;
        typename Clock::time_point storedAt;
    };

    void evictOldestLocked() {
        auto oldest = std::min_element(entries_.begin(), entries_.end(),
                                       [](const auto& a, const auto& b) {
                                           return a.second.storedAt < b.second.storedAt;
                                       });
        if (oldest != entries_.end()) {
            entries_.erase(oldest);
            ++evictions_;
        }
    }

    BoundedCacheConfig config_;
    mutable std::mutex mutex_;
    std::unordered_map<Key, Entry, Hash> entries_;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t evictions_ = 0;
};

} // namespace mediadex
