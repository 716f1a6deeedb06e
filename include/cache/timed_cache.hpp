#pragma once

#include "core/error.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ldapauth {

/**
 * @brief Sharded LRU cache with per-entry time-to-live
 *
 * Replaces memoizing decorators: callers wrap an expensive directory
 * round-trip in get_or_compute() and only successful results are kept.
 *
 * Thread-safety: each shard has its own mutex. The compute function runs
 * outside any lock, so two concurrent misses on the same key both reach the
 * directory; the later insert wins. Readers only ever see complete entries.
 */
template<typename Key, typename Value, typename Hash = std::hash<Key>>
class TimedCache {
public:
    struct Config {
        size_t max_entries = 10000;
        size_t num_shards = 16;
        std::chrono::seconds default_ttl{86400};
    };

    struct Stats {
        uint64_t hits;
        uint64_t misses;
        uint64_t evictions;
        size_t current_entries;
    };

    TimedCache() : TimedCache(Config{}) {}

    explicit TimedCache(const Config& config) : config_(config) {
        const size_t num_shards = std::max(config_.num_shards, size_t{1});
        const size_t per_shard = std::max(config_.max_entries / num_shards, size_t{1});
        shards_.reserve(num_shards);
        for (size_t i = 0; i < num_shards; ++i) {
            shards_.push_back(std::make_unique<Shard>(per_shard));
        }
    }

    TimedCache(const TimedCache&) = delete;
    TimedCache& operator=(const TimedCache&) = delete;

    /// Lookup a live entry. Returns nullopt on miss or expiry.
    [[nodiscard]] std::optional<Value> get(const Key& key) {
        auto result = shard_for(key).get(key);
        if (result) {
            hits_.fetch_add(1, std::memory_order_relaxed);
        } else {
            misses_.fetch_add(1, std::memory_order_relaxed);
        }
        return result;
    }

    void put(const Key& key, Value value, std::chrono::seconds ttl) {
        const auto expires = std::chrono::steady_clock::now() + ttl;
        shard_for(key).put(key, std::move(value), expires);
    }

    void put(const Key& key, Value value) {
        put(key, std::move(value), config_.default_ttl);
    }

    /**
     * @brief Return the cached value, or compute and cache it
     * @param compute Callable returning Result<Value>; failures are returned
     *        to the caller and never cached
     */
    template<typename Fn>
    [[nodiscard]] Result<Value> get_or_compute(const Key& key, std::chrono::seconds ttl,
                                               Fn&& compute) {
        if (auto cached = get(key)) {
            return Result<Value>::ok(std::move(*cached));
        }
        Result<Value> computed = std::forward<Fn>(compute)();
        if (computed.is_ok()) {
            put(key, computed.value(), ttl);
        }
        return computed;
    }

    template<typename Fn>
    [[nodiscard]] Result<Value> get_or_compute(const Key& key, Fn&& compute) {
        return get_or_compute(key, config_.default_ttl, std::forward<Fn>(compute));
    }

    bool invalidate(const Key& key) {
        return shard_for(key).erase(key);
    }

    /// Remove every entry whose key satisfies pred. Returns removed count.
    template<typename Pred>
    size_t invalidate_if(Pred pred) {
        size_t removed = 0;
        for (auto& shard : shards_) {
            removed += shard->erase_if(pred);
        }
        return removed;
    }

    void clear() {
        for (auto& shard : shards_) {
            shard->clear();
        }
    }

    [[nodiscard]] Stats get_stats() const {
        size_t entries = 0;
        uint64_t evictions = 0;
        for (const auto& shard : shards_) {
            entries += shard->size();
            evictions += shard->evictions.load(std::memory_order_relaxed);
        }
        return {
            .hits = hits_.load(std::memory_order_relaxed),
            .misses = misses_.load(std::memory_order_relaxed),
            .evictions = evictions,
            .current_entries = entries,
        };
    }

    [[nodiscard]] std::chrono::seconds default_ttl() const { return config_.default_ttl; }

private:
    struct CacheEntry {
        Key key;
        Value value;
        std::chrono::steady_clock::time_point expires_at;
    };

    class Shard {
    public:
        explicit Shard(size_t max_entries) : max_entries_(max_entries) {}

        std::optional<Value> get(const Key& key) {
            std::lock_guard lock(mutex_);
            auto it = map_.find(key);
            if (it == map_.end()) return std::nullopt;

            if (std::chrono::steady_clock::now() >= it->second->expires_at) {
                lru_list_.erase(it->second);
                map_.erase(it);
                return std::nullopt;
            }

            // Move to front (most recently used)
            lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
            return it->second->value;
        }

        void put(const Key& key, Value value,
                 std::chrono::steady_clock::time_point expires_at) {
            std::lock_guard lock(mutex_);

            auto it = map_.find(key);
            if (it != map_.end()) {
                it->second->value = std::move(value);
                it->second->expires_at = expires_at;
                lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
                return;
            }

            // Evict LRU if at capacity
            while (map_.size() >= max_entries_ && !lru_list_.empty()) {
                map_.erase(lru_list_.back().key);
                lru_list_.pop_back();
                evictions.fetch_add(1, std::memory_order_relaxed);
            }

            lru_list_.emplace_front(CacheEntry{key, std::move(value), expires_at});
            map_[key] = lru_list_.begin();
        }

        bool erase(const Key& key) {
            std::lock_guard lock(mutex_);
            auto it = map_.find(key);
            if (it == map_.end()) return false;
            lru_list_.erase(it->second);
            map_.erase(it);
            return true;
        }

        template<typename Pred>
        size_t erase_if(Pred& pred) {
            std::lock_guard lock(mutex_);
            size_t removed = 0;
            for (auto it = lru_list_.begin(); it != lru_list_.end(); ) {
                if (pred(it->key)) {
                    map_.erase(it->key);
                    it = lru_list_.erase(it);
                    ++removed;
                } else {
                    ++it;
                }
            }
            return removed;
        }

        void clear() {
            std::lock_guard lock(mutex_);
            map_.clear();
            lru_list_.clear();
        }

        size_t size() const {
            std::lock_guard lock(mutex_);
            return map_.size();
        }

        std::atomic<uint64_t> evictions{0};

    private:
        mutable std::mutex mutex_;
        size_t max_entries_;
        std::list<CacheEntry> lru_list_;
        std::unordered_map<Key, typename std::list<CacheEntry>::iterator, Hash> map_;
    };

    Shard& shard_for(const Key& key) {
        return *shards_[Hash{}(key) % shards_.size()];
    }

    Config config_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
};

} // namespace ldapauth
