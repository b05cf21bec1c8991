#pragma once
#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "core/Telemetry.hpp"

namespace wmn {

// One message as it would arrive from the bus.
struct SimMessage {
    std::string topic;
    std::string payload;
};

enum class NodeProfile {
    Nominal,    // good link, analyzer score published
    WeakSignal, // RSSI below -80 dBm
    Spiky,      // steady latency with periodic spikes (anomaly detector)
    Congested,  // high latency/jitter/loss plus congestion flag
    Roaming,    // periodic handover flag
    Silent      // stops publishing after a few ticks (offline)
};

const char* to_string(NodeProfile p);

class SimulatedNode {
public:
    // seed 0: seeded from the clock
    SimulatedNode(std::string id, NodeProfile profile, uint64_t seed = 0);

    const std::string& id() const { return id_; }
    NodeProfile profile() const { return profile_; }
    std::uint64_t ticks() const { return tick_; }

    // Messages published by this node for one tick.
    std::vector<SimMessage> step(TimePoint now);

    static constexpr std::uint64_t kSilentAfterTicks = 10;
    static constexpr std::uint64_t kSpikeEvery = 45;
    static constexpr std::uint64_t kAnalysisEvery = 5;
    static constexpr std::uint64_t kExplainEvery = 30;

private:
    double sample_normal(double mean, double sd);
    nlohmann::json metrics_payload(double ts);
    nlohmann::json analysis_payload(double ts, const nlohmann::json& metrics);

    std::string id_;
    NodeProfile profile_;
    std::mt19937_64 rng_;
    std::uint64_t tick_ = 0;
};

} // namespace wmn
