#pragma once

#include <optional>

#include "core/Telemetry.hpp"

namespace wmn {

// Composite 0-100 wireless experience score from raw link metrics.
// Starts at 100 and subtracts one tier penalty per present metric; absent
// metrics cost nothing. nullopt only when every input is absent.
std::optional<int> compute_health_score(std::optional<double> rssi_dbm,
                                        std::optional<double> latency_ms,
                                        std::optional<double> jitter_ms,
                                        std::optional<double> packet_loss_pct);

int rssi_penalty(double rssi_dbm);
int latency_penalty(double latency_ms);
int jitter_penalty(double jitter_ms);
int loss_penalty(double packet_loss_pct);

enum class HealthSource {
    None,
    Analyzer,
    Computed,
};

const char* to_string(HealthSource source);

struct HealthAssessment {
    std::optional<double> score;
    HealthSource source = HealthSource::None;
};

// Displayed health: the analyzer's score whenever it reported one, otherwise
// the locally computed score.
HealthAssessment assess_health(const std::optional<MetricSnapshot>& metrics,
                               const std::optional<AnalysisSnapshot>& analysis);

} // namespace wmn
