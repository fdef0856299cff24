#include <chrono>
#include <cstdlib>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "config/AppConfig.hpp"
#include "core/FlightCache.hpp"
#include "core/ThreadPoolQueue.hpp"
#include "logging/ConsoleLogger.hpp"
#include "metrics/DummyStatsDClient.hpp"
#include "metrics/StatsDClient.hpp"
#include "models/CacheStats.hpp"
#include "utils/Utils.hpp"

using json = nlohmann::json;

// --- Helper Function to Initialize StatsD Client ---
std::shared_ptr<IStatsDClient> initializeStatsDClient(const AppConfig& config, std::shared_ptr<ILogger> logger_) {
    std::string statsd_server_endpoint;
    const char* statsd_server_value = std::getenv(Constants::STATSD_SERVER_ENV);
    if (statsd_server_value != nullptr) {
        statsd_server_endpoint = std::string(statsd_server_value);
    }

    if (!statsd_server_endpoint.empty()) {
        try {
            logger_->setup("STATSD_SERVER endpoint : " + statsd_server_endpoint);
            return std::make_shared<StatsDClient>(config, logger_, statsd_server_endpoint);
        } catch (const std::exception& e) {
            logger_->error("StatsDClient failed to get created: " + std::string(e.what()));
        }
    }

    logger_->setup("Using DummyStatsDClient.");
    return DummyStatsDClient::getInstance();
}

// The cache key stands for one logical call, so it is derived from every
// argument the operation is bound to.
std::string makeCacheKey(int lower, int upper, int sleep_millis, int multiplier) {
    std::ostringstream key;
    key << "random_number_after_sleep(" << lower << "," << upper << "," << sleep_millis
        << ",multiplier=" << multiplier << ")";
    return key.str();
}

class RandomNumberSource {
public:
    RandomNumberSource() : engine_(std::random_device{}()) {}

    int next(int lower, int upper) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::uniform_int_distribution<int> dist(lower, upper);
        return dist(engine_);
    }

private:
    std::mutex mutex_;
    std::mt19937 engine_;
};

// --- Main Function ---
int main(int argc, char** argv) {
    try {
        std::vector<std::string> args_vec;
        for (int i = 1; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        std::optional<std::map<std::string, std::string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt) {
            ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Failed to parse command-line arguments. Exiting.");
            return 1;
        }

        AppConfig config_ = Utils::loadConfiguration(parsedArgsOpt.value());

        std::shared_ptr<ILogger> logger_ = ConsoleLogger::getInstance(config_.log_level);
        logger_->setup("Configuration loaded.");
        logger_->setup(config_.to_string());

        std::shared_ptr<IStatsDClient> statsd_client = initializeStatsDClient(config_, logger_);

        FlightCache<int> cache(config_.cache, logger_, statsd_client);
        ThreadPoolQueue workers(static_cast<size_t>(config_.worker_threads), logger_);
        RandomNumberSource random_source;

        const int lower = config_.random_lower;
        const int upper = config_.random_upper;
        const int sleep_millis = config_.operation_sleep_in_millis;
        const int multiplier = config_.multiplier;
        const std::string key = makeCacheKey(lower, upper, sleep_millis, multiplier);

        auto operation = [&random_source, &logger_, lower, upper, sleep_millis, multiplier]() {
            logger_->info("Starting sleep...");
            std::this_thread::sleep_for(std::chrono::milliseconds(sleep_millis));
            logger_->info("Sleep ended!");
            return random_source.next(lower, upper) * multiplier;
        };

        const auto start = std::chrono::steady_clock::now();

        std::vector<std::future<int>> parallel_results;
        for (int i = 0; i < 2; ++i) {
            parallel_results.push_back(workers.submit([&cache, &operation, &key]() {
                return cache.call(operation, key);
            }));
        }
        std::vector<int> results;
        for (auto& result : parallel_results) {
            results.push_back(result.get());
        }
        const auto after_parallel = std::chrono::steady_clock::now();

        const int third_number = cache.call(operation, key);
        const auto end = std::chrono::steady_clock::now();

        if (results[0] != results[1] || results[1] != third_number) {
            std::ostringstream ss;
            ss << "Unexpected: " << results[0] << ", " << results[1] << ", " << third_number;
            logger_->error(ss.str());
            return 1;
        }

        auto millis = [](std::chrono::steady_clock::duration d) {
            return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
        };

        json report = {
            {"key", key},
            {"value", third_number},
            {"parallel_calls_millis", millis(after_parallel - start)},
            {"total_millis", millis(end - start)},
            {"stats", cache.stats()}
        };
        std::cout << report.dump(2) << std::endl;

        workers.shutdown();
        return 0;
    } catch (const std::exception& e) {
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Unhandled exception: " + std::string(e.what()));
        return 1;
    }
}
