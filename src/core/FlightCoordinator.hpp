#ifndef FLIGHTCOORDINATOR_HPP
#define FLIGHTCOORDINATOR_HPP

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "CacheErrors.hpp"
#include "../models/Outcome.hpp"

// One execution in progress for a key. Shared by the leader, every follower,
// and the registry until the leader deregisters it.
template <typename T>
struct InFlight {
    std::mutex mutex;
    std::condition_variable done_cv;
    bool completed = false;
    OutcomePtr<T> outcome;
};

// Single-flight registry. tryStart() makes the first caller for a key its
// Leader and every caller that arrives before the leader releases the key a
// Follower of the same InFlight.
template <typename T>
class FlightCoordinator {
public:
    class Leader {
    public:
        Leader(Leader&& other) noexcept
            : coordinator_(other.coordinator_),
              key_(std::move(other.key_)),
              flight_(std::move(other.flight_)),
              completed_(other.completed_),
              released_(other.released_) {
            other.coordinator_ = nullptr;
        }

        Leader& operator=(Leader&&) = delete;
        Leader(const Leader&) = delete;
        Leader& operator=(const Leader&) = delete;

        // An unfinished leader would strand its followers; hand them an error.
        ~Leader() {
            if (!coordinator_ || released_) {
                return;
            }
            try {
                if (!completed_) {
                    complete(Outcome<T>::failure(std::make_exception_ptr(
                        InternalError("leader for key '" + key_ + "' abandoned its flight"))));
                }
                release();
            } catch (const std::exception& e) {
                std::cerr << "FlightCoordinator: " << e.what() << std::endl;
            }
        }

        // Records the outcome and wakes every follower. The key stays
        // registered until release(), so new callers still join this flight.
        void complete(OutcomePtr<T> outcome) {
            if (completed_) {
                throw InternalError("flight for key '" + key_ + "' completed twice");
            }
            {
                std::lock_guard<std::mutex> lock(flight_->mutex);
                if (flight_->completed) {
                    throw InternalError("flight for key '" + key_ + "' completed by another leader");
                }
                flight_->outcome = std::move(outcome);
                flight_->completed = true;
            }
            completed_ = true;
            flight_->done_cv.notify_all();
        }

        // Frees the key for the next race. Only valid after complete().
        void release() {
            if (!completed_) {
                throw InternalError("release before complete for key '" + key_ + "'");
            }
            if (released_) {
                throw InternalError("flight for key '" + key_ + "' released twice");
            }
            released_ = true;
            coordinator_->deregister(key_, flight_);
        }

        // complete() followed by release().
        void finish(OutcomePtr<T> outcome) {
            complete(std::move(outcome));
            release();
        }

        const std::string& key() const { return key_; }

    private:
        friend class FlightCoordinator<T>;

        Leader(FlightCoordinator<T>* coordinator, std::string key, std::shared_ptr<InFlight<T>> flight)
            : coordinator_(coordinator), key_(std::move(key)), flight_(std::move(flight)) {}

        FlightCoordinator<T>* coordinator_;
        std::string key_;
        std::shared_ptr<InFlight<T>> flight_;
        bool completed_ = false;
        bool released_ = false;
    };

    class Follower {
    public:
        // Blocks until the leader completes. Returns at once if it already has.
        OutcomePtr<T> awaitResult() const {
            std::unique_lock<std::mutex> lock(flight_->mutex);
            flight_->done_cv.wait(lock, [this] { return flight_->completed; });
            return flight_->outcome;
        }

    private:
        friend class FlightCoordinator<T>;

        explicit Follower(std::shared_ptr<InFlight<T>> flight) : flight_(std::move(flight)) {}

        std::shared_ptr<InFlight<T>> flight_;
    };

    using Role = std::variant<Leader, Follower>;

    explicit FlightCoordinator(std::size_t shard_count = 16) : shards_(shard_count) {
        if (shard_count == 0) {
            throw ConfigurationError("shard count must be at least 1");
        }
    }

    FlightCoordinator(const FlightCoordinator&) = delete;
    FlightCoordinator& operator=(const FlightCoordinator&) = delete;

    // Atomically looks up and, if absent, registers the in-flight record for key.
    // Every Leader must be finished or destroyed before the coordinator is.
    Role tryStart(const std::string& key) {
        RegistryShard& shard = shardFor(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.flights.find(key);
        if (it != shard.flights.end()) {
            return Role(std::in_place_type<Follower>, Follower(it->second));
        }
        auto flight = std::make_shared<InFlight<T>>();
        shard.flights.emplace(key, flight);
        return Role(std::in_place_type<Leader>, Leader(this, key, std::move(flight)));
    }

    std::size_t inFlightCount() const {
        std::size_t total = 0;
        for (const auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            total += shard.flights.size();
        }
        return total;
    }

private:
    struct RegistryShard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, std::shared_ptr<InFlight<T>>> flights;
    };

    void deregister(const std::string& key, const std::shared_ptr<InFlight<T>>& flight) {
        RegistryShard& shard = shardFor(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.flights.find(key);
        if (it == shard.flights.end() || it->second != flight) {
            throw InternalError("in-flight record for key '" + key + "' missing at release");
        }
        shard.flights.erase(it);
    }

    RegistryShard& shardFor(const std::string& key) {
        return shards_[std::hash<std::string>{}(key) % shards_.size()];
    }

    std::vector<RegistryShard> shards_;
};

#endif // FLIGHTCOORDINATOR_HPP
