#ifndef CACHESTATS_HPP
#define CACHESTATS_HPP

#include <cstdint>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

// --- Snapshot of FlightCache counters ---
class CacheStats {
public:
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t executions = 0;      // operations run by a leader
    uint64_t follower_joins = 0;  // callers that waited on another caller's execution
    uint64_t failures = 0;        // executions that ended in an exception
    uint64_t entries = 0;         // stored entries, fresh or stale
    uint64_t in_flight = 0;

    std::string to_string() const {
        std::ostringstream oss;
        oss << "CacheStats {"
            << " hits: " << hits
            << ", misses: " << misses
            << ", executions: " << executions
            << ", follower_joins: " << follower_joins
            << ", failures: " << failures
            << ", entries: " << entries
            << ", in_flight: " << in_flight
            << " }";
        return oss.str();
    }
};

inline void to_json(nlohmann::json& j, const CacheStats& stats) {
    j = nlohmann::json{
        {"hits", stats.hits},
        {"misses", stats.misses},
        {"executions", stats.executions},
        {"follower_joins", stats.follower_joins},
        {"failures", stats.failures},
        {"entries", stats.entries},
        {"in_flight", stats.in_flight}
    };
}

inline void from_json(const nlohmann::json& j, CacheStats& stats) {
    j.at("hits").get_to(stats.hits);
    j.at("misses").get_to(stats.misses);
    j.at("executions").get_to(stats.executions);
    j.at("follower_joins").get_to(stats.follower_joins);
    j.at("failures").get_to(stats.failures);
    j.at("entries").get_to(stats.entries);
    j.at("in_flight").get_to(stats.in_flight);
}

#endif // CACHESTATS_HPP
