#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "core/Config.hpp"
#include "simulator/SimulatedNode.hpp"

namespace wmn {

// Demo feed: a fleet of simulated nodes publishing into a sink (normally
// IngestionLoop::handle_message) on a fixed interval, no broker involved.
class Simulator {
public:
    using Sink = std::function<void(const std::string& topic, const std::string& payload)>;

    explicit Simulator(DemoConfig cfg);
    ~Simulator();

    Simulator(const Simulator&) = delete;
    Simulator& operator=(const Simulator&) = delete;

    const std::vector<SimulatedNode>& nodes() const { return nodes_; }

    // One round over every node; returns the number of messages sunk.
    std::size_t tick(TimePoint now, const Sink& sink);

    void start(Sink sink);
    void stop();

private:
    DemoConfig cfg_;
    std::vector<SimulatedNode> nodes_;

    std::atomic<bool> running_{false};
    std::thread worker_;
    std::mutex wait_m_;
    std::condition_variable wait_cv_;
};

} // namespace wmn
