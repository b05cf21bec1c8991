#include "net/BusClient.hpp"

#include "core/ErrorCatalog.hpp"

#include <iostream>
#include <random>
#include <stdexcept>

namespace wmn {

std::chrono::milliseconds next_backoff(std::chrono::milliseconds current, std::chrono::milliseconds max) {
    auto doubled = current * 2;
    return doubled > max ? max : doubled;
}

static std::string random_client_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    static const char* hex = "0123456789abcdef";
    std::string out = "wmn-backend-";
    for (int i = 0; i < 12; ++i) out.push_back(hex[(rng() >> ((i % 8) * 8)) & 0xF]);
    return out;
}

// CONNACK return codes 1..5 of MQTT 3.1.1
static const char* connack_reason(int rc) {
    switch (rc) {
        case 1: return "unacceptable protocol version";
        case 2: return "identifier rejected";
        case 3: return "server unavailable";
        case 4: return "bad user name or password";
        case 5: return "not authorized";
        default: return nullptr;
    }
}

static std::string describe(const mqtt::exception& e) {
    std::string out = e.what();
    if (e.get_return_code() != 0) out += " (rc=" + std::to_string(e.get_return_code()) + ")";
    return out;
}

BusClient::BusClient(BusConfig cfg, std::vector<std::string> topic_filters)
: cfg_(std::move(cfg)), topics_(std::move(topic_filters)) {
    if (cfg_.client_id.empty()) cfg_.client_id = random_client_id();
}

BusClient::~BusClient() {
    stop();
}

std::string BusClient::server_uri(const BusConfig& cfg) {
    return std::string(cfg.tls ? "ssl://" : "tcp://") + cfg.host + ":" + std::to_string(cfg.port);
}

mqtt::connect_options BusClient::build_connect_options(const BusConfig& cfg) {
    auto b = mqtt::connect_options_builder();
    b.mqtt_version(MQTTVERSION_3_1_1)
     .clean_session(true)
     .keep_alive_interval(std::chrono::seconds(cfg.keepalive_s))
     .connect_timeout(std::chrono::seconds(10))
     .automatic_reconnect(cfg.backoff_initial, cfg.backoff_max);
    if (cfg.username) b.user_name(*cfg.username);
    if (cfg.password) b.password(*cfg.password);
    if (cfg.tls) {
        // no trust store given: the system default verify paths are used
        b.ssl(mqtt::ssl_options_builder()
                  .enable_server_cert_auth(!cfg.tls_insecure)
                  .verify(!cfg.tls_insecure)
                  .finalize());
    }
    return b.finalize();
}

void BusClient::start() {
    if (running_) return;
    if (cfg_.host.empty()) throw std::runtime_error("BusClient: no broker host configured");
    if (topics_.empty()) throw std::runtime_error("BusClient: no topic filters to subscribe");

    client_ = std::make_unique<mqtt::async_client>(server_uri(cfg_), cfg_.client_id);
    client_->set_connected_handler([this](const std::string& cause) { on_connected(cause); });
    client_->set_connection_lost_handler([this](const std::string& cause) { on_connection_lost(cause); });
    client_->set_message_callback([this](mqtt::const_message_ptr msg) { on_message(std::move(msg)); });

    running_ = true;
    worker_ = std::thread([this]() { connect_loop(); });
}

void BusClient::stop() {
    {
        std::lock_guard<std::mutex> lk(wait_m_);
        running_ = false;
    }
    wait_cv_.notify_all();
    if (worker_.joinable()) worker_.join();

    if (client_) {
        try {
            if (client_->is_connected()) {
                client_->disconnect()->wait();
                std::cout << "BusClient: disconnected from " << cfg_.host << std::endl;
            }
        } catch (const mqtt::exception& e) {
            std::cerr << "BusClient: disconnect failed: " << describe(e) << std::endl;
        }
        client_.reset();
    }
    connected_ = false;
}

// Retries the first connect; once it succeeds automatic reconnect owns the link.
void BusClient::connect_loop() {
    const auto opts = build_connect_options(cfg_);
    auto delay = cfg_.backoff_initial;
    while (running_.load()) {
        attempts_ += 1;
        try {
            auto tok = client_->connect(opts);
            while (running_.load() && !tok->wait_for(std::chrono::milliseconds(100))) {}
            return;
        } catch (const mqtt::exception& e) {
            if (const char* reason = connack_reason(e.get_return_code())) {
                std::cerr << "BusClient: " << errors::format_with_prefix(errors::MSG_E2101_BUS_REFUSED_PREFIX, reason)
                          << std::endl;
            } else {
                std::cerr << "BusClient: "
                          << errors::format_with_prefix(errors::MSG_E2100_BUS_CONNECT_FAILED_PREFIX,
                                                        server_uri(cfg_) + ": " + describe(e))
                          << std::endl;
            }
        }
        if (!running_.load()) break;
        std::cerr << "BusClient: reconnecting in " << delay.count() << " ms" << std::endl;
        wait_backoff(delay);
        delay = next_backoff(delay, cfg_.backoff_max);
    }
}

void BusClient::on_connected(const std::string& cause) {
    if (!cause.empty()) std::cout << "BusClient: " << cause << std::endl;
    std::vector<int> qos(topics_.size(), 0);
    try {
        client_->subscribe(mqtt::string_collection::create(topics_), qos, nullptr, subscribe_listener_);
    } catch (const mqtt::exception& e) {
        std::cerr << "BusClient: "
                  << errors::format_with_prefix(errors::MSG_E2102_BUS_SUBSCRIBE_FAILED_PREFIX, describe(e))
                  << std::endl;
    }
}

void BusClient::on_connection_lost(const std::string& cause) {
    connected_ = false;
    std::cerr << "BusClient: connection to " << cfg_.host << " lost"
              << (cause.empty() ? std::string() : ": " + cause) << std::endl;
}

void BusClient::on_message(mqtt::const_message_ptr msg) {
    if (!handler_ || !msg) return;
    try {
        handler_(msg->get_topic(), msg->to_string());
    } catch (const std::exception& e) {
        std::cerr << "BusClient: message handler error on " << msg->get_topic() << ": " << e.what() << std::endl;
    }
}

void BusClient::SubscribeListener::on_success(const mqtt::token&) {
    owner_.connected_ = true;
    std::cout << "BusClient: connected to " << owner_.cfg_.host << ":" << owner_.cfg_.port
              << (owner_.cfg_.tls ? " (tls)" : "") << ", " << owner_.topics_.size() << " subscriptions" << std::endl;
}

void BusClient::SubscribeListener::on_failure(const mqtt::token& tok) {
    std::cerr << "BusClient: "
              << errors::format_with_prefix(errors::MSG_E2102_BUS_SUBSCRIBE_FAILED_PREFIX,
                                            "rc=" + std::to_string(tok.get_return_code()))
              << std::endl;
}

void BusClient::wait_backoff(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lk(wait_m_);
    wait_cv_.wait_for(lk, delay, [this]() { return !running_.load(); });
}

} // namespace wmn
