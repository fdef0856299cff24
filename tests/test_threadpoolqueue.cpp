// tests/test_threadpoolqueue.cpp
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <vector>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "../src/config/AppConfig.hpp"
#include "../src/core/ThreadPoolQueue.hpp"
#include "TestHelpers.hpp"

using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;

class ThreadPoolQueueTest : public ::testing::Test {
protected:
    std::shared_ptr<NiceMock<MockLogger>> logger = std::make_shared<NiceMock<MockLogger>>();

    void SetUp() override {
        ON_CALL(*logger, getLogLevel()).WillByDefault(Return(LogUtils::LogLevel::CERROR));
    }
};

TEST_F(ThreadPoolQueueTest, RunsSubmittedTasks) {
    ThreadPoolQueue pool(3, logger);
    std::vector<std::future<int>> results;
    for (int i = 0; i < 20; ++i) {
        results.push_back(pool.submit([i]() { return i * i; }));
    }
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(results[i].get(), i * i);
    }
}

TEST_F(ThreadPoolQueueTest, SubmitDeliversExceptionsThroughFuture) {
    ThreadPoolQueue pool(1, logger);
    auto result = pool.submit([]() -> int { throw std::runtime_error("task failed"); });
    EXPECT_THROW(result.get(), std::runtime_error);
}

TEST_F(ThreadPoolQueueTest, EnqueuedTaskExceptionIsLogged) {
    std::promise<void> logged;
    EXPECT_CALL(*logger, error(HasSubstr("task exploded"))).WillOnce([&logged](const std::string&) {
        logged.set_value();
    });

    ThreadPoolQueue pool(1, logger);
    ASSERT_TRUE(pool.enqueue([]() { throw std::runtime_error("task exploded"); }));
    EXPECT_EQ(logged.get_future().wait_for(std::chrono::seconds(2)), std::future_status::ready);
}

TEST_F(ThreadPoolQueueTest, ShutdownDrainsQueueAndRejectsNewWork) {
    std::atomic<int> ran{0};
    ThreadPoolQueue pool(2, logger);
    for (int i = 0; i < 50; ++i) {
        pool.enqueue([&ran]() { ++ran; });
    }
    pool.shutdown();
    EXPECT_EQ(ran.load(), 50);

    EXPECT_FALSE(pool.enqueue([]() {}));
    EXPECT_THROW(pool.submit([]() { return 1; }), std::runtime_error);
}

TEST_F(ThreadPoolQueueTest, RejectsInvalidConstruction) {
    EXPECT_THROW(ThreadPoolQueue(0, logger), std::invalid_argument);
    EXPECT_THROW(ThreadPoolQueue(1, nullptr), std::invalid_argument);
}
