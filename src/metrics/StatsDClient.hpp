#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// StatsD line-protocol client over UDP. Lines are joined with '\n' into one
// datagram until metrics_batch_size lines are queued or
// metrics_send_interval_in_millis has passed since the last datagram.
class StatsDClient : public IStatsDClient {
public:
    StatsDClient(
        const AppConfig& config,
        std::shared_ptr<ILogger> logger,
        const std::string& stats_server_endpoint);
    ~StatsDClient() override;

    void increment(const std::string& key, int value = 1) override;
    void decrement(const std::string& key, int value = 1) override;
    void gauge(const std::string& key, double value) override;
    void timing(const std::string& key, std::chrono::milliseconds value) override;
    void set(const std::string& key, const std::string& value) override;

    // Sends whatever is queued, even a partial batch.
    void flush();

private:
    void send(const std::string& message);
    void flushLocked();

    std::shared_ptr<ILogger> logger_;
    boost::asio::io_context ioc_;
    boost::asio::ip::udp::socket socket_;
    boost::asio::ip::udp::endpoint endpoint_;

    const std::size_t batch_size_;
    const std::chrono::milliseconds send_interval_;

    std::mutex batch_mutex_;
    std::string batch_;
    std::size_t batched_lines_ = 0;
    std::chrono::steady_clock::time_point last_send_;

    StatsDClient(const StatsDClient&) = delete;
    StatsDClient& operator=(const StatsDClient&) = delete;
    StatsDClient(StatsDClient&&) = delete;
    StatsDClient& operator=(StatsDClient&&) = delete;
};
