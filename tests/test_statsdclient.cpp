// tests/test_statsdclient.cpp
#include <array>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/udp.hpp>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "../src/config/AppConfig.hpp"
#include "../src/metrics/StatsDClient.hpp"
#include "TestHelpers.hpp"

using namespace std::chrono_literals;
using ::testing::NiceMock;
using udp = boost::asio::ip::udp;

class StatsDClientTest : public ::testing::Test {
protected:
    boost::asio::io_context ioc;
    udp::socket receiver{ioc, udp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)};
    std::shared_ptr<NiceMock<MockLogger>> logger = std::make_shared<NiceMock<MockLogger>>();

    std::string endpoint() const {
        return "127.0.0.1:" + std::to_string(receiver.local_endpoint().port());
    }

    static AppConfig configWithBatch(int batch_size, int interval_millis = 60000) {
        AppConfig config;
        config.metrics_batch_size = batch_size;
        config.metrics_send_interval_in_millis = interval_millis;
        return config;
    }

    // Polls so a missing datagram fails the test instead of hanging it.
    std::optional<std::string> receiveWithin(std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (receiver.available() == 0) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return std::nullopt;
            }
            std::this_thread::sleep_for(2ms);
        }
        std::array<char, 2048> buffer{};
        udp::endpoint sender;
        size_t received = receiver.receive_from(boost::asio::buffer(buffer), sender);
        return std::string(buffer.data(), received);
    }
};

TEST_F(StatsDClientTest, SendsCounterLine) {
    StatsDClient client(configWithBatch(1), logger, endpoint());
    client.increment(MetricsDefinitions::CACHE_HIT);

    auto datagram = receiveWithin(1s);
    ASSERT_TRUE(datagram.has_value());
    EXPECT_EQ(*datagram, "flightcache.hit:1|c");
}

TEST_F(StatsDClientTest, FormatsEveryMetricType) {
    StatsDClient client(configWithBatch(1), logger, endpoint());

    client.decrement("gauge.key", 3);
    EXPECT_EQ(receiveWithin(1s).value_or(""), "gauge.key:-3|c");
    client.gauge("load", 0.5);
    EXPECT_EQ(receiveWithin(1s).value_or(""), "load:0.5|g");
    client.timing(MetricsDefinitions::OPERATION_DURATION, 250ms);
    EXPECT_EQ(receiveWithin(1s).value_or(""), "flightcache.duration:250|ms");
    client.set("users", "alice");
    EXPECT_EQ(receiveWithin(1s).value_or(""), "users:alice|s");
}

TEST_F(StatsDClientTest, BatchesUntilFull) {
    StatsDClient client(configWithBatch(3), logger, endpoint());

    client.increment("a");
    client.increment("b");
    EXPECT_FALSE(receiveWithin(100ms).has_value());

    client.increment("c");
    auto datagram = receiveWithin(1s);
    ASSERT_TRUE(datagram.has_value());
    EXPECT_EQ(*datagram, "a:1|c\nb:1|c\nc:1|c");
}

TEST_F(StatsDClientTest, FlushSendsPartialBatch) {
    StatsDClient client(configWithBatch(10), logger, endpoint());
    client.increment("only");
    client.flush();

    EXPECT_EQ(receiveWithin(1s).value_or(""), "only:1|c");
}

TEST_F(StatsDClientTest, DestructorFlushesPendingLines) {
    {
        StatsDClient client(configWithBatch(10), logger, endpoint());
        client.increment("pending");
    }
    EXPECT_EQ(receiveWithin(1s).value_or(""), "pending:1|c");
}

TEST_F(StatsDClientTest, ElapsedIntervalFlushesSmallBatch) {
    StatsDClient client(configWithBatch(100, 10), logger, endpoint());
    std::this_thread::sleep_for(20ms);
    client.increment("late");

    EXPECT_EQ(receiveWithin(1s).value_or(""), "late:1|c");
}

TEST_F(StatsDClientTest, RejectsMalformedEndpoint) {
    EXPECT_THROW(StatsDClient(configWithBatch(1), logger, "no-port-here"), std::runtime_error);
    EXPECT_THROW(StatsDClient(configWithBatch(1), logger, "127.0.0.1:abc"), std::runtime_error);
}

TEST_F(StatsDClientTest, RejectsPortOutOfRangeOrWithTrailingText) {
    EXPECT_THROW(StatsDClient(configWithBatch(1), logger, "127.0.0.1:70000"), std::runtime_error);
    EXPECT_THROW(StatsDClient(configWithBatch(1), logger, "127.0.0.1:0"), std::runtime_error);
    EXPECT_THROW(StatsDClient(configWithBatch(1), logger, "127.0.0.1:80abc"), std::runtime_error);
    EXPECT_THROW(StatsDClient(configWithBatch(1), logger, "127.0.0.1:"), std::runtime_error);
}

TEST_F(StatsDClientTest, RejectsNullLogger) {
    EXPECT_THROW(StatsDClient(configWithBatch(1), nullptr, endpoint()), std::invalid_argument);
}
