#include <cstdlib>
#include <memory>
#include <sstream>
#include <stdexcept>

#include "StatsDClient.hpp"

// Define static members
std::shared_ptr<StatsDClient> StatsDClient::instance = nullptr;
std::once_flag StatsDClient::init_flag;

std::shared_ptr<StatsDClient> StatsDClient::getInstance(
    const AppConfig& config, 
    std::shared_ptr<ILogger> logger, 
    const std::string& stats_server_endpoint) {
    std::call_once(init_flag, [&config, logger, stats_server_endpoint]() {
        instance = std::shared_ptr<StatsDClient>(new StatsDClient(config, logger, stats_server_endpoint));
    });

    return instance;
}

StatsDClient::StatsDClient(
    const AppConfig& config, 
    std::shared_ptr<ILogger> logger, 
    const std::string& statsd_address) : logger_(logger), udp_sender_(nullptr) {
    auto colon_pos = statsd_address.find(':');
    if (colon_pos == std::string::npos) {
        throw std::runtime_error("STATSD_SERVER must be in the format <host>:<port>");
    }

    std::string host = statsd_address.substr(0, colon_pos);
    if (host == "localhost") {
        host = "127.0.0.1";
    }

    const std::string port_text = statsd_address.substr(colon_pos + 1);
    int parsed_port = 0;
    std::size_t consumed = 0;
    try {
        parsed_port = std::stoi(port_text, &consumed);
    } catch (const std::exception& e) {
        throw std::runtime_error("Invalid port in STATSD_SERVER: " + std::string(e.what()));
    }
    if (consumed != port_text.size() || parsed_port < 1 || parsed_port > 65535) {
        throw std::runtime_error("Invalid port in STATSD_SERVER: " + port_text + " (expected 1-65535)");
    }
    const auto port = static_cast<uint16_t>(parsed_port);

    udp_sender_ = std::make_unique<Statsd::UDPSender>(
        host,
        port,
        static_cast<uint64_t>(config.metrics_batch_size),
        static_cast<uint64_t>(config.metrics_send_interval_in_millis));
    if (!udp_sender_->initialized()) {
        throw std::runtime_error("Failed to initialize UDPSender: " + udp_sender_->errorMessage());
    }
    logger_->setup("UDPSender initialized for " + host + ":" + std::to_string(port));
}

StatsDClient::~StatsDClient() {
    // unique_ptr flushes and closes the UDPSender
    logger_->debug("StatsDClient destroyed.");
}

void StatsDClient::send(const std::string& message) {
    if (!udp_sender_) {
        logger_->error("StatsDClient: UDPSender is not initialized, cannot send message.");
        return;
    }
    udp_sender_->send(message);
}

// Increment a counter
void StatsDClient::increment(const std::string& key, int value) {
    std::stringstream ss;
    ss << key << ":" << value << "|c";
    send(ss.str());
}

// Decrement a counter
void StatsDClient::decrement(const std::string& key, int value) {
    increment(key, -value);
}

// Record a gauge value
void StatsDClient::gauge(const std::string& key, double value) {
    std::stringstream ss;
    ss << key << ":" << value << "|g";
    send(ss.str());
}

// Record a timing value
void StatsDClient::timing(const std::string& key, std::chrono::milliseconds value) {
    std::stringstream ss;
    ss << key << ":" << value.count() << "|ms";
    send(ss.str());
}
