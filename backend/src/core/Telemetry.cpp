#include "core/Telemetry.hpp"

using json = nlohmann::json;

namespace wmn {

const char* to_string(MessageKind kind) {
    switch (kind) {
        case MessageKind::Metrics: return "metrics";
        case MessageKind::Analysis: return "analysis";
        case MessageKind::Explain: return "explain";
    }
    return "unknown";
}

bool operator==(const MetricSnapshot& a, const MetricSnapshot& b) {
    return a.rssi_dbm == b.rssi_dbm && a.latency_ms == b.latency_ms && a.jitter_ms == b.jitter_ms &&
           a.packet_loss_pct == b.packet_loss_pct && a.interface_name == b.interface_name &&
           a.channel == b.channel && a.throughput_up_mbps == b.throughput_up_mbps &&
           a.throughput_down_mbps == b.throughput_down_mbps && a.raw == b.raw;
}

bool operator==(const AnalysisSnapshot& a, const AnalysisSnapshot& b) {
    return a.score == b.score && a.handover_detected == b.handover_detected &&
           a.congestion_detected == b.congestion_detected && a.raw == b.raw;
}

bool operator==(const ExplanationSnapshot& a, const ExplanationSnapshot& b) {
    return a.text == b.text;
}

bool operator==(const Sample& a, const Sample& b) {
    return a.ts == b.ts && a.value == b.value;
}

double to_epoch_seconds(TimePoint tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

TimePoint from_epoch_seconds(double seconds) {
    auto d = std::chrono::duration<double>(seconds);
    return TimePoint(std::chrono::duration_cast<Clock::duration>(d));
}

template <typename T>
static void put_optional(json& out, const char* key, const std::optional<T>& v) {
    if (v) {
        out[key] = *v;
    } else {
        out[key] = nullptr;
    }
}

json to_json(const MetricSnapshot& m) {
    json out = json::object();
    put_optional(out, "rssi_dbm", m.rssi_dbm);
    put_optional(out, "latency_ms_avg", m.latency_ms);
    put_optional(out, "jitter_ms", m.jitter_ms);
    put_optional(out, "packet_loss_pct", m.packet_loss_pct);
    put_optional(out, "interface", m.interface_name);
    put_optional(out, "channel", m.channel);
    put_optional(out, "throughput_up_mbps", m.throughput_up_mbps);
    put_optional(out, "throughput_down_mbps", m.throughput_down_mbps);
    return out;
}

json to_json(const AnalysisSnapshot& a) {
    json out = json::object();
    put_optional(out, "wireless_score_0_100", a.score);
    out["handover_detected"] = a.handover_detected;
    out["congestion_detected"] = a.congestion_detected;
    return out;
}

json to_json(const std::vector<Sample>& samples) {
    json arr = json::array();
    for (const auto& s : samples) {
        arr.push_back({ {"t", to_epoch_seconds(s.ts)}, {"v", s.value} });
    }
    return arr;
}

} // namespace wmn
