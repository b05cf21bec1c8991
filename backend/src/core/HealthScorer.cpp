#include "core/HealthScorer.hpp"

#include <algorithm>

namespace wmn {

int rssi_penalty(double rssi_dbm) {
    if (rssi_dbm >= -60.0) return 0;
    if (rssi_dbm >= -70.0) return 8;
    if (rssi_dbm >= -80.0) return 20;
    return 35;
}

int latency_penalty(double latency_ms) {
    if (latency_ms <= 60.0) return 0;
    if (latency_ms <= 120.0) return 10;
    if (latency_ms <= 200.0) return 25;
    return 40;
}

int jitter_penalty(double jitter_ms) {
    if (jitter_ms <= 15.0) return 0;
    if (jitter_ms <= 35.0) return 10;
    if (jitter_ms <= 60.0) return 20;
    return 30;
}

int loss_penalty(double packet_loss_pct) {
    if (packet_loss_pct <= 1.0) return 0;
    if (packet_loss_pct <= 3.0) return 15;
    if (packet_loss_pct <= 6.0) return 30;
    return 45;
}

std::optional<int> compute_health_score(std::optional<double> rssi_dbm,
                                        std::optional<double> latency_ms,
                                        std::optional<double> jitter_ms,
                                        std::optional<double> packet_loss_pct) {
    if (!rssi_dbm && !latency_ms && !jitter_ms && !packet_loss_pct) return std::nullopt;

    double s = 100.0;
    if (rssi_dbm) s -= rssi_penalty(*rssi_dbm);
    if (latency_ms) s -= latency_penalty(*latency_ms);
    if (jitter_ms) s -= jitter_penalty(*jitter_ms);
    if (packet_loss_pct) s -= loss_penalty(*packet_loss_pct);
    return static_cast<int>(std::clamp(s, 0.0, 100.0));
}

const char* to_string(HealthSource source) {
    switch (source) {
        case HealthSource::None: return "none";
        case HealthSource::Analyzer: return "analyzer";
        case HealthSource::Computed: return "computed";
    }
    return "none";
}

HealthAssessment assess_health(const std::optional<MetricSnapshot>& metrics,
                               const std::optional<AnalysisSnapshot>& analysis) {
    HealthAssessment out;
    if (analysis && analysis->score) {
        out.score = *analysis->score;
        out.source = HealthSource::Analyzer;
        return out;
    }
    if (!metrics) return out;

    auto local = compute_health_score(metrics->rssi_dbm, metrics->latency_ms, metrics->jitter_ms,
                                      metrics->packet_loss_pct);
    if (local) {
        out.score = static_cast<double>(*local);
        out.source = HealthSource::Computed;
    }
    return out;
}

} // namespace wmn
