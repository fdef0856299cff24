#ifndef TESTHELPERS_HPP
#define TESTHELPERS_HPP

#include <chrono>
#include <functional>
#include <mutex>
#include <string>

#include "gmock/gmock.h"

#include "../src/interfaces/IClock.hpp"
#include "../src/interfaces/ILogger.hpp"
#include "../src/interfaces/IStatsDClient.hpp"

// Clock that only moves when a test advances it.
class ManualClock : public IClock {
public:
    ManualClock() : now_(std::chrono::steady_clock::now()) {}

    time_point now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(std::chrono::milliseconds delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += delta;
    }

private:
    mutable std::mutex mutex_;
    time_point now_;
};

// ManualClock that runs a one-shot hook inside the next now() call and shifts
// the time that call returns by skew. Later calls are plain ManualClock reads.
class HookedClock : public ManualClock {
public:
    void onNextNow(std::function<void()> hook, std::chrono::milliseconds skew = std::chrono::milliseconds(0)) {
        std::lock_guard<std::mutex> lock(hook_mutex_);
        hook_ = std::move(hook);
        skew_ = skew;
    }

    time_point now() const override {
        std::function<void()> hook;
        std::chrono::milliseconds skew(0);
        {
            std::lock_guard<std::mutex> lock(hook_mutex_);
            hook.swap(hook_);
            std::swap(skew, skew_);
        }
        if (hook) {
            hook();
        }
        return ManualClock::now() + skew;
    }

private:
    mutable std::mutex hook_mutex_;
    mutable std::function<void()> hook_;
    mutable std::chrono::milliseconds skew_{0};
};

class MockStatsDClient : public IStatsDClient {
public:
    MOCK_METHOD(void, increment, (const std::string& key, int value), (override));
    MOCK_METHOD(void, decrement, (const std::string& key, int value), (override));
    MOCK_METHOD(void, gauge, (const std::string& key, double value), (override));
    MOCK_METHOD(void, timing, (const std::string& key, std::chrono::milliseconds value), (override));
    MOCK_METHOD(void, set, (const std::string& key, const std::string& value), (override));
};

class MockLogger : public ILogger {
public:
    MOCK_METHOD(void, info, (const std::string& message), (override));
    MOCK_METHOD(void, debug, (const std::string& message), (override));
    MOCK_METHOD(void, warn, (const std::string& message), (override));
    MOCK_METHOD(void, error, (const std::string& message), (override));
    MOCK_METHOD(void, setup, (const std::string& message), (override));
    MOCK_METHOD(int, getLogLevel, (), (override));
};

#endif // TESTHELPERS_HPP
