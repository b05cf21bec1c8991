#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace wmn {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

inline constexpr const char* kUnknownDeviceId = "unknown";

enum class MessageKind {
    Metrics,
    Analysis,
    Explain,
};

const char* to_string(MessageKind kind);

// Latest link metrics reported by a device. Every field is optional: an absent
// reading stays absent, a reading of 0 is a real reading.
struct MetricSnapshot {
    std::optional<double> rssi_dbm;
    std::optional<double> latency_ms;
    std::optional<double> jitter_ms;
    std::optional<double> packet_loss_pct;
    std::optional<std::string> interface_name;
    std::optional<int> channel;
    std::optional<double> throughput_up_mbps;
    std::optional<double> throughput_down_mbps;

    // the nested "metrics" object as received, forwarded to the explainer
    nlohmann::json raw = nlohmann::json::object();
};

struct AnalysisSnapshot {
    std::optional<double> score;
    bool handover_detected = false;
    bool congestion_detected = false;

    nlohmann::json raw = nlohmann::json::object();
};

struct ExplanationSnapshot {
    std::string text;
};

// One point of a bounded history (latency in ms or score 0-100).
struct Sample {
    TimePoint ts;
    double value = 0.0;
};

// A message that survived decoding. Exactly one of the three records is set,
// matching `kind`.
struct TelemetryMessage {
    MessageKind kind = MessageKind::Metrics;
    std::string device_id = kUnknownDeviceId;
    // origination time carried in the payload ("ts", epoch seconds), if any
    std::optional<TimePoint> origin_ts;

    std::optional<MetricSnapshot> metrics;
    std::optional<AnalysisSnapshot> analysis;
    std::optional<ExplanationSnapshot> explanation;
};

bool operator==(const MetricSnapshot& a, const MetricSnapshot& b);
bool operator==(const AnalysisSnapshot& a, const AnalysisSnapshot& b);
bool operator==(const ExplanationSnapshot& a, const ExplanationSnapshot& b);
bool operator==(const Sample& a, const Sample& b);

double to_epoch_seconds(TimePoint tp);
TimePoint from_epoch_seconds(double seconds);

nlohmann::json to_json(const MetricSnapshot& m);
nlohmann::json to_json(const AnalysisSnapshot& a);
nlohmann::json to_json(const std::vector<Sample>& samples);

} // namespace wmn
