#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/system/error_code.hpp>

#include "StatsDClient.hpp"

namespace net = boost::asio;
using udp = boost::asio::ip::udp;

StatsDClient::StatsDClient(
    const AppConfig& config,
    std::shared_ptr<ILogger> logger,
    const std::string& statsd_address)
    : logger_(logger),
      socket_(ioc_),
      batch_size_(config.metrics_batch_size > 0 ? static_cast<std::size_t>(config.metrics_batch_size) : 1),
      send_interval_(config.metrics_send_interval_in_millis),
      last_send_(std::chrono::steady_clock::now()) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for StatsDClient");
    }
    auto colon_pos = statsd_address.find(':');
    if (colon_pos == std::string::npos) {
        throw std::runtime_error("STATSD_SERVER must be in the format <host>:<port>");
    }

    std::string host_ = statsd_address.substr(0, colon_pos);
    if (host_ == "localhost") {
        host_ = "127.0.0.1";
    }

    const std::string port_text = statsd_address.substr(colon_pos + 1);
    int parsed_port = 0;
    size_t parsed_chars = 0;
    try {
        parsed_port = std::stoi(port_text, &parsed_chars);
    } catch (const std::exception& e) {
        throw std::runtime_error("Invalid port in STATSD_SERVER: " + std::string(e.what()));
    }
    if (parsed_chars != port_text.size() || parsed_port < 1 || parsed_port > 65535) {
        throw std::runtime_error("Invalid port in STATSD_SERVER: " + port_text);
    }
    const uint16_t port = static_cast<uint16_t>(parsed_port);

    boost::system::error_code ec;
    udp::resolver resolver(ioc_);
    auto results = resolver.resolve(udp::v4(), host_, std::to_string(port), ec);
    if (ec || results.empty()) {
        throw std::runtime_error("Failed to resolve StatsD host " + host_ + ": " + ec.message());
    }
    endpoint_ = *results.begin();

    socket_.open(udp::v4(), ec);
    if (ec) {
        throw std::runtime_error("Failed to open StatsD UDP socket: " + ec.message());
    }
    logger_->setup("StatsDClient sending to " + host_ + ":" + std::to_string(port));
}

StatsDClient::~StatsDClient() {
    flush();
    boost::system::error_code ec;
    socket_.close(ec);
    logger_->debug("StatsDClient destroyed.");
}

void StatsDClient::flush() {
    std::lock_guard<std::mutex> lock(batch_mutex_);
    flushLocked();
}

void StatsDClient::flushLocked() {
    if (batch_.empty()) {
        return;
    }
    boost::system::error_code ec;
    socket_.send_to(net::buffer(batch_), endpoint_, 0, ec);
    if (ec) {
        // Metrics are best effort; a lost datagram must not fail the caller.
        logger_->error("StatsDClient: Failed to send UDP message: " + ec.message());
    }
    batch_.clear();
    batched_lines_ = 0;
    last_send_ = std::chrono::steady_clock::now();
}

void StatsDClient::send(const std::string& message) {
    std::lock_guard<std::mutex> lock(batch_mutex_);
    if (!batch_.empty()) {
        batch_.push_back('\n');
    }
    batch_ += message;
    ++batched_lines_;
    if (batched_lines_ >= batch_size_ ||
        std::chrono::steady_clock::now() - last_send_ >= send_interval_) {
        flushLocked();
    }
}

void StatsDClient::increment(const std::string& key, int value) {
    std::stringstream ss;
    ss << key << ":" << value << "|c";
    send(ss.str());
}

void StatsDClient::decrement(const std::string& key, int value) {
    increment(key, -value);
}

void StatsDClient::gauge(const std::string& key, double value) {
    std::stringstream ss;
    ss << key << ":" << value << "|g";
    send(ss.str());
}

void StatsDClient::timing(const std::string& key, std::chrono::milliseconds value) {
    std::stringstream ss;
    ss << key << ":" << value.count() << "|ms";
    send(ss.str());
}

void StatsDClient::set(const std::string& key, const std::string& value) {
    std::stringstream ss;
    ss << key << ":" << value << "|s";
    send(ss.str());
}
