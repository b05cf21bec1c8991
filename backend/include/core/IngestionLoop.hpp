#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "core/Config.hpp"
#include "core/DeviceStore.hpp"

namespace wmn {

class BusClient;

/**
 * @brief Bus subscription feeding decoded telemetry into the device store.
 *
 * handle_message() is the single write path into the store; the bus client
 * calls it from its own thread and the demo simulator calls it directly.
 * Malformed or foreign messages are counted and dropped, never propagated.
 */
class IngestionLoop {
public:
    explicit IngestionLoop(DeviceStore& store);
    ~IngestionLoop();

    IngestionLoop(const IngestionLoop&) = delete;
    IngestionLoop& operator=(const IngestionLoop&) = delete;

    static std::vector<std::string> topic_filters();

    // Returns true when the message reached the store.
    bool handle_message(const std::string& topic, const std::string& payload, TimePoint received_at);
    bool handle_message(const std::string& topic, const std::string& payload) {
        return handle_message(topic, payload, Clock::now());
    }

    void start(const BusConfig& cfg);
    void stop();

    bool connected() const;
    std::uint64_t accepted() const { return accepted_.load(); }
    std::uint64_t rejected() const { return rejected_.load(); }
    std::uint64_t ignored() const { return ignored_.load(); }

private:
    DeviceStore& store_;
    std::unique_ptr<BusClient> bus_;

    std::atomic<std::uint64_t> accepted_{0};
    std::atomic<std::uint64_t> rejected_{0};
    std::atomic<std::uint64_t> ignored_{0};
};

} // namespace wmn
