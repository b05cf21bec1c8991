#include "simulator/Simulator.hpp"
#include <algorithm>
#include <functional>
#include <iostream>
#include <iomanip>
#include <sstream>

namespace wmn {

static const NodeProfile kProfiles[] = {
    NodeProfile::Nominal, NodeProfile::WeakSignal, NodeProfile::Spiky,
    NodeProfile::Congested, NodeProfile::Roaming, NodeProfile::Silent
};

Simulator::Simulator(DemoConfig cfg)
: cfg_(std::move(cfg)) {
    const int n = std::max(1, cfg_.nodes);
    nodes_.reserve(static_cast<std::size_t>(n));
    for (int i = 0; i < n; ++i) {
        std::ostringstream id;
        id << "sim-node-" << std::setw(2) << std::setfill('0') << (i + 1);
        uint64_t node_seed = cfg_.seed ? cfg_.seed + std::hash<std::string>{}(id.str()) : 0;
        nodes_.emplace_back(id.str(), kProfiles[i % 6], node_seed);
    }
}

Simulator::~Simulator() {
    stop();
}

std::size_t Simulator::tick(TimePoint now, const Sink& sink) {
    std::size_t sent = 0;
    for (auto& node : nodes_) {
        for (const auto& msg : node.step(now)) {
            sink(msg.topic, msg.payload);
            ++sent;
        }
    }
    return sent;
}

void Simulator::start(Sink sink) {
    if (running_) return;
    running_ = true;
    std::cout << "Simulator: " << nodes_.size() << " nodes, interval " << cfg_.interval.count() << " ms" << std::endl;
    worker_ = std::thread([this, sink = std::move(sink)]() {
        while (running_) {
            try {
                tick(Clock::now(), sink);
            } catch (const std::exception& e) {
                std::cerr << "Simulator: tick failed: " << e.what() << std::endl;
            }
            std::unique_lock<std::mutex> lk(wait_m_);
            wait_cv_.wait_for(lk, cfg_.interval, [this]() { return !running_.load(); });
        }
    });
}

void Simulator::stop() {
    {
        std::lock_guard<std::mutex> lk(wait_m_);
        running_ = false;
    }
    wait_cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

} // namespace wmn
