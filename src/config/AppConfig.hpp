#ifndef APPCONFIG_HPP
#define APPCONFIG_HPP

#include <iostream>
#include <sstream>
#include <string>

#include "CacheConfig.hpp"

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        SETUP = 4
    };

    static std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static std::string INFO_LOG_PREFIX = "[Info] ";
    static std::string WARN_LOG_PREFIX = "[Warning] ";
    static std::string CERROR_LOG_PREFIX = "[Error] ";
    static std::string SETUP_LOG_PREFIX = "[Setup] ";
}

namespace MetricsDefinitions {
    static std::string CACHE_HIT = "flightcache.hit";

    static std::string CACHE_MISS = "flightcache.miss";

    static std::string LEADER_EXECUTION = "flightcache.leader";

    static std::string FOLLOWER_JOINED = "flightcache.follower";

    static std::string OPERATION_FAILURE = "flightcache.failure";

    static std::string OPERATION_DURATION = "flightcache.duration";
}

namespace Constants {
    static constexpr auto CONFIG_FILE_NAME = "flightcache.config";
    static constexpr auto STATSD_SERVER_ENV = "STATSD_SERVER";
};

// --- Configuration Struct ---
class AppConfig {
public:
    // Cache configuration
    CacheConfig cache;

    // Logging Level
    LogUtils::LogLevel log_level;

    // Metrics
    int metrics_batch_size;
    int metrics_send_interval_in_millis;

    // Demo workload
    int worker_threads;
    int operation_sleep_in_millis;
    int random_lower;
    int random_upper;
    int multiplier;

    AppConfig() {
        // --- Set Defaults  ---
        log_level = LogUtils::LogLevel::CERROR;
        metrics_batch_size = 100;
        metrics_send_interval_in_millis = 1000;

        worker_threads = 2;
        operation_sleep_in_millis = 1000;
        random_lower = 1;
        random_upper = 10;
        multiplier = 100;
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "// --- Cache Configuration --- //" << std::endl
            << cache.to_string()
            << "// --- Logging & Metrics --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl
            << "metrics_batch_size: " << metrics_batch_size << std::endl
            << "metrics_send_interval_in_millis: " << metrics_send_interval_in_millis << std::endl
            << "// --- Demo Workload --- //" << std::endl
            << "worker_threads: " << worker_threads << std::endl
            << "operation_sleep_in_millis: " << operation_sleep_in_millis << std::endl
            << "random_range: [" << random_lower << ", " << random_upper << "]" << std::endl
            << "multiplier: " << multiplier << std::endl;
        ss << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // APPCONFIG_HPP
