#ifndef CACHECONFIG_HPP
#define CACHECONFIG_HPP

#include <cstddef>
#include <sstream>
#include <string>

// Settings for a single FlightCache instance. The TTL is uniform across all keys.
struct CacheConfig {
    long long timeout_in_millis = 5000;
    // When false a failed execution is handed to its waiters but not stored,
    // so the next call for the key runs the operation again.
    bool cache_failures = false;
    // Number of independently locked partitions in the store and the in-flight
    // registry. 1 gives a single global lock.
    std::size_t shard_count = 16;

    std::string to_string() const {
        std::stringstream ss;
        ss << "cache_timeout_in_millis: " << timeout_in_millis << std::endl
           << "cache_failures: " << std::boolalpha << cache_failures << std::noboolalpha << std::endl
           << "cache_shard_count: " << shard_count << std::endl;
        return ss.str();
    }
};

#endif // CACHECONFIG_HPP
