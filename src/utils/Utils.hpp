#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../config/AppConfig.hpp"

class Utils {
public:
    // Converts a string to a LogLevel enum
    static LogUtils::LogLevel stringToLogLevel(const std::string& level) {
        if (level == "DEBUG") return LogUtils::LogLevel::DEBUG;
        if (level == "INFO") return LogUtils::LogLevel::INFO;
        if (level == "WARNING") return LogUtils::LogLevel::WARN;
        if (level == "CERROR") return LogUtils::LogLevel::CERROR;
        throw std::invalid_argument("Invalid log level: " + level);
    }

    // Helper to parse integer safely
    static std::optional<int> stringToInt(const std::string& str) {
        try {
            size_t pos;
            int val = std::stoi(str, &pos);
            // Check if the entire string was consumed
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
            // Not an integer
        } catch (const std::out_of_range&) {
            // Integer out of range
        }
        return std::nullopt;
    }

    static std::optional<long long> stringToLongLong(const std::string& str) {
        try {
            size_t pos;
            long long val = std::stoll(str, &pos);
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
        } catch (const std::out_of_range&) {
        }
        return std::nullopt;
    }

    // Accepts 1/0, true/false, yes/no in any case.
    static std::optional<bool> stringToBool(const std::string& str) {
        std::string lowered = str;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lowered == "1" || lowered == "true" || lowered == "yes") return true;
        if (lowered == "0" || lowered == "false" || lowered == "no") return false;
        return std::nullopt;
    }

    // Helper to trim whitespace from start and end of string
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (std::string::npos == first) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    // Function to parse key-value pairs from a string (using optional version)
    static std::optional<std::map<std::string, std::string>> parseArguments(const std::vector<std::string>& args) {
        std::map<std::string, std::string> argMap;
        for (const std::string& arg : args) {
            size_t delimiterPos = arg.find('=');
            if (delimiterPos != std::string::npos && delimiterPos > 0) { // Ensure key is not empty
                argMap[arg.substr(0, delimiterPos)] = arg.substr(delimiterPos + 1);
            } else {
                std::cerr << "Error: Invalid argument format: '" << arg << "'. Expected non-empty key=value format." << std::endl;
                return std::nullopt;
            }
        }
        return argMap;
    }

    // Applies one configuration setting. Returns false, leaving config
    // untouched, when the key is unknown or the value does not parse.
    static bool applySetting(AppConfig& config, const std::string& key, const std::string& value) {
        if (key == "cache_timeout_in_millis") {
            if (auto val = stringToLongLong(value)) {
                config.cache.timeout_in_millis = *val;
                return true;
            }
        } else if (key == "cache_failures") {
            if (auto val = stringToBool(value)) {
                config.cache.cache_failures = *val;
                return true;
            }
        } else if (key == "cache_shard_count") {
            if (auto val = stringToInt(value); val && *val > 0) {
                config.cache.shard_count = static_cast<size_t>(*val);
                return true;
            }
        } else if (key == "log_level") {
            try {
                config.log_level = stringToLogLevel(value);
                return true;
            } catch (const std::invalid_argument& e) {
                std::cerr << "Warning: " << e.what() << std::endl;
                return false;
            }
        } else if (key == "metrics_batch_size") {
            if (auto val = stringToInt(value)) {
                config.metrics_batch_size = *val;
                return true;
            }
        } else if (key == "metrics_send_interval") {
            // value provided in millis
            if (auto val = stringToInt(value)) {
                config.metrics_send_interval_in_millis = *val;
                return true;
            }
        } else if (key == "worker_threads") {
            if (auto val = stringToInt(value); val && *val > 0) {
                config.worker_threads = *val;
                return true;
            }
        } else if (key == "operation_sleep_in_millis") {
            if (auto val = stringToInt(value); val && *val >= 0) {
                config.operation_sleep_in_millis = *val;
                return true;
            }
        } else if (key == "random_lower") {
            if (auto val = stringToInt(value)) {
                config.random_lower = *val;
                return true;
            }
        } else if (key == "random_upper") {
            if (auto val = stringToInt(value)) {
                config.random_upper = *val;
                return true;
            }
        } else if (key == "multiplier") {
            if (auto val = stringToInt(value)) {
                config.multiplier = *val;
                return true;
            }
        } else {
            std::cerr << "Warning: Unknown configuration key: " << key << std::endl;
            return false;
        }
        std::cerr << "Warning: Invalid value for " << key << ": " << value << std::endl;
        return false;
    }

    static std::vector<std::string> defaultConfigPaths() {
        return {
            Constants::CONFIG_FILE_NAME,                          // Current directory
            std::string("../") + Constants::CONFIG_FILE_NAME,     // Parent directory
            std::string("/etc/flightcache/") + Constants::CONFIG_FILE_NAME
        };
    }

    // Loads the first config file found in config_paths, then applies the
    // command-line arguments on top of it.
    static AppConfig loadConfiguration(const std::map<std::string, std::string>& startupArguments,
                                       const std::vector<std::string>& config_paths = defaultConfigPaths()) {
        AppConfig config;

        bool config_found = false;
        for (const auto& config_path : config_paths) {
            std::ifstream configFile(config_path);
            if (!configFile.is_open()) {
                continue;
            }
            std::cout << "Reading configuration from " << config_path << "..." << std::endl;
            config_found = true;
            std::string line;
            while (std::getline(configFile, line)) {
                line = trim(line);
                if (line.empty() || line[0] == '#') { // Skip empty lines and comments
                    continue;
                }
                size_t delimiterPos = line.find('=');
                if (delimiterPos != std::string::npos && delimiterPos > 0) {
                    applySetting(config, trim(line.substr(0, delimiterPos)), trim(line.substr(delimiterPos + 1)));
                } else {
                    std::cerr << "Warning: Ignoring malformed config line: " << line << std::endl;
                }
            }
            break;
        }

        if (!config_found) {
            std::cerr << "Warning: Configuration file not found in any standard location. Using defaults and command-line arguments." << std::endl;
        }

        for (const auto& [key, value] : startupArguments) {
            applySetting(config, key, value);
        }

        return config;
    }
};

#endif // UTILS_HPP
