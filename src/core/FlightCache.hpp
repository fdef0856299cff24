#ifndef FLIGHTCACHE_HPP
#define FLIGHTCACHE_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <variant>

#include "CacheErrors.hpp"
#include "FlightCoordinator.hpp"
#include "SteadyClock.hpp"
#include "../cache/ExpiringStore.hpp"
#include "../config/AppConfig.hpp"
#include "../config/CacheConfig.hpp"
#include "../interfaces/IClock.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../models/CacheStats.hpp"
#include "../models/Outcome.hpp"

// Time-bounded memoization with single-flight execution.
//
// call(operation, key) returns the stored result for key while it is younger
// than the configured TTL. Otherwise the first caller runs operation on its own
// thread, with no cache lock held, and every caller racing on the same key
// waits for and receives that one result, or that one exception.
//
// Followers wait without a deadline: if an operation never returns, neither
// do the callers waiting on its key.
template <typename T>
class FlightCache {
public:
    using Operation = std::function<T()>;

    FlightCache(const CacheConfig& config,
                std::shared_ptr<ILogger> logger,
                std::shared_ptr<IStatsDClient> statsd_client,
                std::shared_ptr<IClock> clock = SteadyClock::getInstance())
        : config_(config),
          logger_(std::move(logger)),
          statsd_client_(std::move(statsd_client)),
          clock_(std::move(clock)),
          store_(std::chrono::milliseconds(config.timeout_in_millis), config.shard_count, clock_),
          coordinator_(config.shard_count) {
        if (!logger_) {
            throw ConfigurationError("logger cannot be null");
        }
        if (!statsd_client_) {
            throw ConfigurationError("StatsDClient cannot be null");
        }
        logger_->setup("FlightCache created with timeout " + std::to_string(config_.timeout_in_millis) +
                       "ms, " + std::to_string(config_.shard_count) + " shards, failures " +
                       (config_.cache_failures ? "cached" : "not cached"));
    }

    FlightCache(const FlightCache&) = delete;
    FlightCache& operator=(const FlightCache&) = delete;
    FlightCache(FlightCache&&) = delete;
    FlightCache& operator=(FlightCache&&) = delete;

    // Runs operation through the cache and returns its value, or rethrows the
    // exception it raised. The exception object is the one the operation threw.
    T call(const Operation& operation, const std::string& key) {
        return callOutcome(operation, key)->value();
    }

    // Same protocol as call(), without unwrapping. Every caller served by the
    // same execution receives the same Outcome object.
    OutcomePtr<T> callOutcome(const Operation& operation, const std::string& key) {
        if (OutcomePtr<T> cached = store_.get(key)) {
            recordHit(key);
            return cached;
        }

        auto role = coordinator_.tryStart(key);

        if (auto* follower = std::get_if<typename FlightCoordinator<T>::Follower>(&role)) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            follower_joins_.fetch_add(1, std::memory_order_relaxed);
            statsd_client_->increment(MetricsDefinitions::CACHE_MISS);
            statsd_client_->increment(MetricsDefinitions::FOLLOWER_JOINED);
            debugLog("Key '" + key + "' is in flight, waiting for its leader");
            return follower->awaitResult();
        }

        auto& leader = std::get<typename FlightCoordinator<T>::Leader>(role);

        // The previous leader may have published and left the registry between
        // the lookup above and tryStart.
        if (OutcomePtr<T> cached = store_.get(key)) {
            leader.finish(cached);
            recordHit(key);
            return cached;
        }

        misses_.fetch_add(1, std::memory_order_relaxed);
        statsd_client_->increment(MetricsDefinitions::CACHE_MISS);
        debugLog("Key '" + key + "' missed, executing as leader");

        OutcomePtr<T> outcome = execute(operation, key);

        // Followers get the outcome before the entry is visible to new lookups.
        // The key stays registered until the store holds the entry, so a caller
        // missing the store in between still joins this flight.
        leader.complete(outcome);
        if (outcome->isSuccess() || config_.cache_failures) {
            store_.put(key, outcome, clock_->now());
        }
        leader.release();
        return outcome;
    }

    // Forgets the stored result for key. An execution already in flight is not
    // affected and will publish when it completes.
    bool drop(const std::string& key) {
        bool removed = store_.remove(key);
        if (removed) {
            debugLog("Key '" + key + "' dropped");
        }
        return removed;
    }

    void clear() {
        store_.clear();
        logger_->info("FlightCache cleared");
    }

    std::size_t size() const { return store_.size(); }

    std::size_t inFlightCount() const { return coordinator_.inFlightCount(); }

    std::size_t purgeExpired() {
        std::size_t removed = store_.purgeExpired();
        if (removed > 0) {
            logger_->info("FlightCache purged " + std::to_string(removed) + " expired entries");
        }
        return removed;
    }

    CacheStats stats() const {
        CacheStats snapshot;
        snapshot.hits = hits_.load(std::memory_order_relaxed);
        snapshot.misses = misses_.load(std::memory_order_relaxed);
        snapshot.executions = executions_.load(std::memory_order_relaxed);
        snapshot.follower_joins = follower_joins_.load(std::memory_order_relaxed);
        snapshot.failures = failures_.load(std::memory_order_relaxed);
        snapshot.entries = store_.size();
        snapshot.in_flight = coordinator_.inFlightCount();
        return snapshot;
    }

    const CacheConfig& config() const { return config_; }

private:
    OutcomePtr<T> execute(const Operation& operation, const std::string& key) {
        executions_.fetch_add(1, std::memory_order_relaxed);
        statsd_client_->increment(MetricsDefinitions::LEADER_EXECUTION);
        const auto started = clock_->now();

        OutcomePtr<T> outcome;
        try {
            outcome = Outcome<T>::success(operation());
        } catch (...) {
            outcome = Outcome<T>::failure(std::current_exception());
        }

        statsd_client_->timing(MetricsDefinitions::OPERATION_DURATION,
            std::chrono::duration_cast<std::chrono::milliseconds>(clock_->now() - started));

        if (outcome->isFailure()) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            statsd_client_->increment(MetricsDefinitions::OPERATION_FAILURE);
            logger_->warn("Operation for key '" + key + "' failed: " + outcome->errorMessage());
        }
        return outcome;
    }

    void recordHit(const std::string& key) {
        hits_.fetch_add(1, std::memory_order_relaxed);
        statsd_client_->increment(MetricsDefinitions::CACHE_HIT);
        debugLog("Key '" + key + "' served from cache");
    }

    void debugLog(const std::string& message) {
        if (logger_->getLogLevel() <= LogUtils::LogLevel::DEBUG) {
            logger_->debug(message);
        }
    }

    const CacheConfig config_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::shared_ptr<IClock> clock_;
    ExpiringStore<T> store_;
    FlightCoordinator<T> coordinator_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> executions_{0};
    std::atomic<uint64_t> follower_joins_{0};
    std::atomic<uint64_t> failures_{0};
};

#endif // FLIGHTCACHE_HPP
