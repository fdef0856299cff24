#ifndef EXPIRINGSTORE_HPP
#define EXPIRINGSTORE_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../core/CacheErrors.hpp"
#include "../interfaces/IClock.hpp"
#include "../models/Outcome.hpp"

template <typename T>
struct CacheEntry {
    OutcomePtr<T> outcome;
    IClock::time_point created_at;
};

// Key -> last published Outcome with its creation time.
//
// Expiry is lazy: a stale entry stays in the map until it is overwritten,
// removed, or swept by purgeExpired(), but get() never returns it. Keys are
// spread over shard_count partitions, each guarded by its own mutex, so
// lookups for keys on different shards do not contend.
template <typename T>
class ExpiringStore {
public:
    ExpiringStore(std::chrono::milliseconds ttl, std::size_t shard_count, std::shared_ptr<IClock> clock)
        : ttl_(ttl), shards_(shard_count), clock_(std::move(clock)) {
        if (ttl_.count() <= 0) {
            throw ConfigurationError("TTL must be positive, got " + std::to_string(ttl_.count()) + "ms");
        }
        if (shard_count == 0) {
            throw ConfigurationError("shard count must be at least 1");
        }
        if (!clock_) {
            throw ConfigurationError("clock cannot be null");
        }
    }

    ExpiringStore(const ExpiringStore&) = delete;
    ExpiringStore& operator=(const ExpiringStore&) = delete;

    // Returns the stored Outcome if now - created_at < TTL, nullptr otherwise.
    OutcomePtr<T> get(const std::string& key) const {
        const IClock::time_point now = clock_->now();
        const Shard& shard = shardFor(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.entries.find(key);
        if (it == shard.entries.end() || !isFresh(it->second, now)) {
            return nullptr;
        }
        return it->second.outcome;
    }

    // Unconditionally replaces the entry for key.
    void put(const std::string& key, OutcomePtr<T> outcome, IClock::time_point now) {
        Shard& shard = shardFor(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        shard.entries[key] = CacheEntry<T>{std::move(outcome), now};
    }

    bool remove(const std::string& key) {
        Shard& shard = shardFor(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        return shard.entries.erase(key) > 0;
    }

    void clear() {
        for (auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            shard.entries.clear();
        }
    }

    // Counts stored entries, including stale ones not yet purged.
    std::size_t size() const {
        std::size_t total = 0;
        for (const auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            total += shard.entries.size();
        }
        return total;
    }

    // Drops every stale entry and returns how many were dropped.
    std::size_t purgeExpired() {
        std::size_t removed = 0;
        const auto now = clock_->now();
        for (auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            for (auto it = shard.entries.begin(); it != shard.entries.end(); ) {
                if (!isFresh(it->second, now)) {
                    it = shard.entries.erase(it);
                    ++removed;
                } else {
                    ++it;
                }
            }
        }
        return removed;
    }

    std::chrono::milliseconds ttl() const { return ttl_; }
    std::size_t shardCount() const { return shards_.size(); }

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, CacheEntry<T>> entries;
    };

    bool isFresh(const CacheEntry<T>& entry, IClock::time_point now) const {
        return now - entry.created_at < ttl_;
    }

    Shard& shardFor(const std::string& key) {
        return shards_[std::hash<std::string>{}(key) % shards_.size()];
    }

    const Shard& shardFor(const std::string& key) const {
        return shards_[std::hash<std::string>{}(key) % shards_.size()];
    }

    const std::chrono::milliseconds ttl_;
    std::vector<Shard> shards_;
    std::shared_ptr<IClock> clock_;
};

#endif // EXPIRINGSTORE_HPP
