#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <mqtt/async_client.h>

#include "core/Config.hpp"

namespace wmn {

// Doubling backoff, capped at `max`.
std::chrono::milliseconds next_backoff(std::chrono::milliseconds current, std::chrono::milliseconds max);

/**
 * @brief Long-lived MQTT subscription on top of the Paho async client.
 *
 * Connects (optionally over TLS) and subscribes to the configured topic
 * filters on every (re)connect; every message is handed to the message
 * handler on the Paho callback thread. Until the first connect succeeds the
 * client retries on its own thread with bounded exponential backoff; after
 * that Paho's automatic reconnect takes over with the same bounds.
 */
class BusClient {
public:
    using MessageHandler = std::function<void(const std::string& topic, const std::string& payload)>;

    BusClient(BusConfig cfg, std::vector<std::string> topic_filters);
    ~BusClient();

    BusClient(const BusClient&) = delete;
    BusClient& operator=(const BusClient&) = delete;

    // Must be set before start().
    void set_handler(MessageHandler h) { handler_ = std::move(h); }

    void start();
    // Interrupts pending retries, sends DISCONNECT when connected and
    // releases the Paho client.
    void stop();

    bool connected() const { return connected_.load(); }
    std::uint64_t connect_attempts() const { return attempts_.load(); }
    const std::string& client_id() const { return cfg_.client_id; }

    // "tcp://host:port" or "ssl://host:port"
    static std::string server_uri(const BusConfig& cfg);
    static mqtt::connect_options build_connect_options(const BusConfig& cfg);

private:
    class SubscribeListener : public virtual mqtt::iaction_listener {
    public:
        explicit SubscribeListener(BusClient& owner) : owner_(owner) {}
        void on_success(const mqtt::token& tok) override;
        void on_failure(const mqtt::token& tok) override;

    private:
        BusClient& owner_;
    };

    void connect_loop();
    void on_connected(const std::string& cause);
    void on_connection_lost(const std::string& cause);
    void on_message(mqtt::const_message_ptr msg);
    void wait_backoff(std::chrono::milliseconds delay);

    BusConfig cfg_;
    std::vector<std::string> topics_;
    MessageHandler handler_;

    std::unique_ptr<mqtt::async_client> client_;
    SubscribeListener subscribe_listener_{*this};

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<std::uint64_t> attempts_{0};
    std::thread worker_;

    std::mutex wait_m_;
    std::condition_variable wait_cv_;
};

} // namespace wmn
