#include "simulator/SimulatedNode.hpp"
#include "core/HealthScorer.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>

using json = nlohmann::json;

namespace wmn {

const char* to_string(NodeProfile p) {
    switch (p) {
        case NodeProfile::Nominal: return "nominal";
        case NodeProfile::WeakSignal: return "weak_signal";
        case NodeProfile::Spiky: return "spiky";
        case NodeProfile::Congested: return "congested";
        case NodeProfile::Roaming: return "roaming";
        case NodeProfile::Silent: return "silent";
    }
    return "unknown";
}

SimulatedNode::SimulatedNode(std::string id, NodeProfile profile, uint64_t seed)
: id_(std::move(id)), profile_(profile) {
    if (seed == 0) {
        rng_.seed((unsigned)std::chrono::high_resolution_clock::now().time_since_epoch().count());
    } else {
        rng_.seed(seed);
    }
}

double SimulatedNode::sample_normal(double mean, double sd) {
    std::normal_distribution<double> d(mean, sd);
    return d(rng_);
}

static double round1(double v) {
    return std::round(v * 10.0) / 10.0;
}

json SimulatedNode::metrics_payload(double ts) {
    double rssi = sample_normal(-55.0, 3.0);
    double lat = sample_normal(35.0, 4.0);
    double jit = sample_normal(6.0, 2.0);
    double loss = std::abs(sample_normal(0.0, 0.3));

    switch (profile_) {
        case NodeProfile::WeakSignal:
            rssi = sample_normal(-84.0, 2.0);
            lat = sample_normal(55.0, 6.0);
            break;
        case NodeProfile::Spiky:
            lat = sample_normal(40.0, 3.0);
            if (tick_ % kSpikeEvery == kSpikeEvery - 1) lat = sample_normal(260.0, 20.0);
            break;
        case NodeProfile::Congested:
            rssi = sample_normal(-66.0, 3.0);
            lat = sample_normal(175.0, 15.0);
            jit = sample_normal(58.0, 8.0);
            loss = std::abs(sample_normal(4.0, 1.0));
            break;
        case NodeProfile::Roaming:
            rssi = sample_normal(-70.0, 6.0);
            break;
        default:
            break;
    }

    return {
        {"device_id", id_},
        {"ts", ts},
        {"metrics", {
            {"rssi_dbm", round1(rssi)},
            {"latency_ms_avg", round1(std::max(1.0, lat))},
            {"jitter_ms", round1(std::max(0.0, jit))},
            {"packet_loss_pct", round1(loss)},
            {"interface", "wlan0"},
            {"channel", profile_ == NodeProfile::Roaming && (tick_ / 20) % 2 ? 149 : 36},
            {"throughput_up_mbps", round1(std::max(0.0, sample_normal(40.0, 8.0)))},
            {"throughput_down_mbps", round1(std::max(0.0, sample_normal(180.0, 30.0)))}
        }}
    };
}

json SimulatedNode::analysis_payload(double ts, const json& metrics) {
    const json& m = metrics["metrics"];
    json a = {
        {"handover_detected", profile_ == NodeProfile::Roaming && tick_ % 20 == 0},
        {"congestion_detected", profile_ == NodeProfile::Congested}
    };
    // Only some analyzers report a score; the rest fall back to local scoring.
    if (profile_ == NodeProfile::Nominal || profile_ == NodeProfile::Roaming) {
        auto local = compute_health_score(m["rssi_dbm"].get<double>(), m["latency_ms_avg"].get<double>(),
                                          m["jitter_ms"].get<double>(), m["packet_loss_pct"].get<double>());
        a["wireless_score_0_100"] = std::clamp(static_cast<double>(local.value_or(0)) + sample_normal(0.0, 2.0), 0.0, 100.0);
    }
    return { {"device_id", id_}, {"ts", ts}, {"analysis", a} };
}

std::vector<SimMessage> SimulatedNode::step(TimePoint now) {
    std::vector<SimMessage> out;
    if (profile_ == NodeProfile::Silent && tick_ >= kSilentAfterTicks) {
        ++tick_;
        return out;
    }
    const double ts = to_epoch_seconds(now);
    json metrics = metrics_payload(ts);
    out.push_back({ "wmn/metrics/" + id_, metrics.dump() });
    if (tick_ % kAnalysisEvery == 0) {
        out.push_back({ "wmn/analysis/" + id_, analysis_payload(ts, metrics).dump() });
    }
    if (tick_ % kExplainEvery == 0) {
        json e = {
            {"device_id", id_},
            {"text", std::string("Link profile '") + to_string(profile_) + "' on channel "
                     + std::to_string(metrics["metrics"]["channel"].get<int>()) + "."}
        };
        out.push_back({ "wmn/explain/" + id_, e.dump() });
    }
    ++tick_;
    return out;
}

} // namespace wmn
